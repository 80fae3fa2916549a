#pragma once

#include "animation-types.hpp"

#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include <vector>

// Owns the two animation roots and the persisted display order.
class AnimationStore {
public:
	AnimationStore();
	~AnimationStore();

	// Creates both roots if needed and loads the saved order
	void Initialize(const QString &builtInRoot, const QString &userRoot, const QString &configPath);

	// Persistence
	void Load();
	void Persist();

	// Animation files
	std::vector<AnimationEntry> ListFiles() const;
	AnimationError ImportFile(const QString &sourcePath, AnimationEntry &entry);
	bool DeleteFile(const QString &path);

	// Order management
	QStringList GetOrder() const { return order; }
	void SetOrder(const QStringList &paths);

	QString GetBuiltInRoot() const { return builtInRoot; }
	QString GetUserRoot() const { return userRoot; }
	QString GetConfigPath() const { return configPath; }

	// Absolute, cleaned, '/' separated. Empty input stays empty.
	static QString NormalizePath(const QString &path);

private:
	void EnsureDirectory(const QString &path) const;
	void ListDirectory(const QString &root, AnimationOrigin origin,
		std::vector<AnimationEntry> &entries, QSet<QString> &seen) const;
	bool RemoveAnimation(const QString &target);

private:
	QString builtInRoot;
	QString userRoot;
	QString configPath;

	// Normalized paths, user preferred sequence
	QStringList order;

	// Keys other than gif_order, written back untouched
	QJsonObject otherSettings;
};
