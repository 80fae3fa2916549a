#pragma once

#include "animation-store.hpp"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QTemporaryDir>

// Temporary built-in root, user root and config file for one test.
struct PetDirs {
	QTemporaryDir tmp;
	QString builtInRoot;
	QString userRoot;
	QString configPath;

	PetDirs()
		: builtInRoot(tmp.filePath(QStringLiteral("install/resources/gifs"))),
		  userRoot(tmp.filePath(QStringLiteral("data/gifs"))),
		  configPath(tmp.filePath(QStringLiteral("data/config.json")))
	{
	}

	void Init(AnimationStore &store) const
	{
		store.Initialize(builtInRoot, userRoot, configPath);
	}

	// Any bytes will do, nothing here decodes the files
	QString WriteFile(const QString &dir, const QString &name,
		const QByteArray &content = QByteArrayLiteral("GIF89a")) const
	{
		QDir().mkpath(dir);
		QFile file(QDir(dir).filePath(name));
		if (file.open(QIODevice::WriteOnly))
			file.write(content);
		return AnimationStore::NormalizePath(file.fileName());
	}

	QString Outside(const QString &name, const QByteArray &content = QByteArrayLiteral("GIF89a")) const
	{
		return WriteFile(tmp.filePath(QStringLiteral("downloads")), name, content);
	}

	void WriteConfig(const QByteArray &json) const
	{
		QDir().mkpath(QFileInfo(configPath).absolutePath());
		QFile file(configPath);
		if (file.open(QIODevice::WriteOnly))
			file.write(json);
	}

	QByteArray ReadConfig() const
	{
		QFile file(configPath);
		return file.open(QIODevice::ReadOnly) ? file.readAll() : QByteArray();
	}
};
