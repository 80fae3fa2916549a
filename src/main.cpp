#include "app-context.hpp"
#include "pet-logging.hpp"
#include "pet-window.hpp"
#include "tray-controller.hpp"

#include <QApplication>
#include <QCommandLineParser>

#include <cstdio>

int main(int argc, char *argv[])
{
	QApplication app(argc, argv);
	QApplication::setApplicationName(QStringLiteral("desktop-pet"));
	QApplication::setApplicationDisplayName(QStringLiteral("Desktop Pet"));
	QApplication::setApplicationVersion(QStringLiteral(PROJECT_VERSION));

	// The pet lives on in the tray when its window is closed
	app.setQuitOnLastWindowClosed(false);

	PetOptions options = DefaultPetOptions();
	QCommandLineParser parser;
	QString errorMessage;
	switch (ParsePetOptions(parser, QApplication::arguments(), options, errorMessage)) {
	case OptionsResult::Error:
		std::fprintf(stderr, "%s\n", qUtf8Printable(errorMessage));
		return 1;
	case OptionsResult::HelpRequested:
		parser.showHelp();
		return 0;
	case OptionsResult::VersionRequested:
		parser.showVersion();
		return 0;
	case OptionsResult::Ok:
		break;
	}

	EnableVerboseLogging(options.verbose);
	qCInfo(lcUi, "Desktop Pet %s starting", PROJECT_VERSION);

	AppContext context(options);

	PetWindow petWindow(&context);
	petWindow.show();

	if (!QSystemTrayIcon::isSystemTrayAvailable())
		qCWarning(lcTray, "System tray is not available");

	TrayController tray(&context, &petWindow);
	tray.show();

	return app.exec();
}
