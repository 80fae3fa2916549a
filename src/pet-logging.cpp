#include "pet-logging.hpp"

Q_LOGGING_CATEGORY(lcStore, "desktoppet.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcManager, "desktoppet.manager", QtInfoMsg)
Q_LOGGING_CATEGORY(lcUi, "desktoppet.ui", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTray, "desktoppet.tray", QtInfoMsg)

void EnableVerboseLogging(bool verbose)
{
	if (verbose)
		QLoggingCategory::setFilterRules(QStringLiteral("desktoppet.*.debug=true"));
}
