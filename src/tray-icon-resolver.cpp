#include "tray-icon-resolver.hpp"
#include "pet-logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStringList>

static QString FirstMatch(const QDir &dir, const QString &pattern)
{
	const QFileInfoList files = dir.entryInfoList({pattern}, QDir::Files, QDir::Name);
	return files.isEmpty() ? QString() : files.first().absoluteFilePath();
}

QString ResolveTrayIconPath(const QString &iconsDir, const QString &preferredName)
{
	if (iconsDir.isEmpty())
		return QString();

	if (!QDir().mkpath(iconsDir)) {
		qCWarning(lcTray, "Failed to create icon directory %s", qUtf8Printable(iconsDir));
		return QString();
	}

	const QDir dir(iconsDir);

	if (!preferredName.isEmpty()) {
		const QFileInfo preferred(dir.filePath(preferredName));
		if (preferred.isFile())
			return preferred.absoluteFilePath();
	}

	const QStringList patterns = {
		QStringLiteral("*.jpg"),
		QStringLiteral("*.png"),
		QStringLiteral("*.ico"),
		QStringLiteral("*.gif"),
	};
	for (const QString &pattern : patterns) {
		const QString match = FirstMatch(dir, pattern);
		if (!match.isEmpty())
			return match;
	}

	return QString();
}
