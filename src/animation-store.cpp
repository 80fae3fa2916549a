#include "animation-store.hpp"
#include "pet-logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include <algorithm>

static const QString kOrderKey = QStringLiteral("gif_order");
static const QString kAnimationFilter = QStringLiteral("*.gif");

AnimationStore::AnimationStore()
{
}

AnimationStore::~AnimationStore()
{
}

QString AnimationStore::NormalizePath(const QString &path)
{
	if (path.isEmpty())
		return QString();

	QString unified = path;
	unified.replace(QLatin1Char('\\'), QLatin1Char('/'));
	return QDir::cleanPath(QFileInfo(unified).absoluteFilePath());
}

void AnimationStore::EnsureDirectory(const QString &path) const
{
	if (path.isEmpty())
		return;

	if (!QDir().mkpath(path)) {
		qCWarning(lcStore, "Failed to create directory %s", qUtf8Printable(path));
	}
}

void AnimationStore::Initialize(const QString &builtIn, const QString &user, const QString &config)
{
	builtInRoot = NormalizePath(builtIn);
	userRoot = NormalizePath(user);
	configPath = NormalizePath(config);

	EnsureDirectory(builtInRoot);
	EnsureDirectory(userRoot);

	Load();
}

void AnimationStore::Load()
{
	order.clear();
	otherSettings = QJsonObject();

	if (configPath.isEmpty())
		return;

	QFile file(configPath);
	if (!file.exists()) {
		qCInfo(lcStore, "No saved order found");
		return;
	}

	if (!file.open(QIODevice::ReadOnly)) {
		qCWarning(lcStore, "Failed to read order config %s: %s (%s)",
			qUtf8Printable(configPath), qUtf8Printable(file.errorString()),
			AnimationErrorName(AnimationError::ConfigIOError));
		return;
	}

	QJsonParseError parseError;
	const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
	if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
		qCWarning(lcStore, "Ignoring malformed order config %s: %s (%s)",
			qUtf8Printable(configPath), qUtf8Printable(parseError.errorString()),
			AnimationErrorName(AnimationError::ConfigIOError));
		return;
	}

	QJsonObject root = doc.object();
	const QJsonValue orderValue = root.take(kOrderKey);
	otherSettings = root;

	if (orderValue.isUndefined()) {
		qCInfo(lcStore, "Order config has no %s entry", qUtf8Printable(kOrderKey));
		return;
	}

	if (!orderValue.isArray()) {
		qCWarning(lcStore, "Ignoring %s: expected an array (%s)", qUtf8Printable(kOrderKey),
			AnimationErrorName(AnimationError::ConfigIOError));
		return;
	}

	QSet<QString> seen;
	const QJsonArray entries = orderValue.toArray();
	for (const QJsonValue &entry : entries) {
		const QString path = NormalizePath(entry.toString());
		if (path.isEmpty() || seen.contains(path))
			continue;

		// Files removed while we were not running lose their position
		if (!QFileInfo(path).isFile()) {
			qCDebug(lcStore, "Dropping missing file %s from order", qUtf8Printable(path));
			continue;
		}

		seen.insert(path);
		order.append(path);
	}

	qCInfo(lcStore, "Loaded order with %lld entries", static_cast<long long>(order.size()));
}

void AnimationStore::Persist()
{
	if (configPath.isEmpty())
		return;

	EnsureDirectory(QFileInfo(configPath).absolutePath());

	QJsonObject root = otherSettings;
	root.insert(kOrderKey, QJsonArray::fromStringList(order));
	const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);

	QSaveFile file(configPath);
	if (!file.open(QIODevice::WriteOnly)) {
		qCWarning(lcStore, "Failed to save order config %s: %s (%s)",
			qUtf8Printable(configPath), qUtf8Printable(file.errorString()),
			AnimationErrorName(AnimationError::ConfigIOError));
		return;
	}

	if (file.write(data) != data.size() || !file.commit()) {
		qCWarning(lcStore, "Failed to save order config %s: %s (%s)",
			qUtf8Printable(configPath), qUtf8Printable(file.errorString()),
			AnimationErrorName(AnimationError::ConfigIOError));
		return;
	}

	qCDebug(lcStore, "Saved order config");
}

void AnimationStore::ListDirectory(const QString &root, AnimationOrigin origin,
	std::vector<AnimationEntry> &entries, QSet<QString> &seen) const
{
	if (root.isEmpty())
		return;

	const QDir dir(root);
	const QFileInfoList files = dir.entryInfoList({kAnimationFilter}, QDir::Files, QDir::Name);
	for (const QFileInfo &info : files) {
		const QString path = NormalizePath(info.absoluteFilePath());
		if (seen.contains(path))
			continue;

		seen.insert(path);
		entries.push_back({path, origin});
	}
}

std::vector<AnimationEntry> AnimationStore::ListFiles() const
{
	std::vector<AnimationEntry> entries;
	QSet<QString> seen;

	ListDirectory(builtInRoot, AnimationOrigin::BuiltIn, entries, seen);
	ListDirectory(userRoot, AnimationOrigin::User, entries, seen);

	return entries;
}

AnimationError AnimationStore::ImportFile(const QString &sourcePath, AnimationEntry &entry)
{
	const QFileInfo source(sourcePath);
	if (sourcePath.isEmpty() || !source.isFile()) {
		qCWarning(lcStore, "Import source %s does not exist (%s)", qUtf8Printable(sourcePath),
			AnimationErrorName(AnimationError::NotFound));
		return AnimationError::NotFound;
	}

	EnsureDirectory(userRoot);

	const QString target = NormalizePath(QDir(userRoot).filePath(source.fileName()));
	entry.path = target;
	entry.origin = AnimationOrigin::User;

	// Same name already imported: hand back the existing copy
	if (QFileInfo::exists(target)) {
		qCInfo(lcStore, "%s is already imported", qUtf8Printable(source.fileName()));
		return AnimationError::None;
	}

	if (!QFile::copy(source.absoluteFilePath(), target)) {
		qCWarning(lcStore, "Failed to copy %s to %s (%s)", qUtf8Printable(source.absoluteFilePath()),
			qUtf8Printable(target), AnimationErrorName(AnimationError::CopyFailed));
		return AnimationError::CopyFailed;
	}

	// QFile::copy keeps permissions but not timestamps
	QFile copied(target);
	if (!copied.open(QIODevice::ReadWrite) ||
	    !copied.setFileTime(source.lastModified(), QFileDevice::FileModificationTime)) {
		qCDebug(lcStore, "Could not preserve modification time of %s", qUtf8Printable(target));
	}

	qCInfo(lcStore, "Imported animation %s", qUtf8Printable(target));
	return AnimationError::None;
}

bool AnimationStore::RemoveAnimation(const QString &target)
{
	// The order is only touched once the file is gone
	QFile file(target);
	if (!file.remove()) {
		qCWarning(lcStore, "Failed to delete %s: %s (%s)", qUtf8Printable(target),
			qUtf8Printable(file.errorString()), AnimationErrorName(AnimationError::NotFound));
		return false;
	}

	// Entries may still point at an older location of the same file
	const QString fileName = QFileInfo(target).fileName();
	order.erase(std::remove_if(order.begin(), order.end(),
		[&](const QString &path) {
			return path == target || QFileInfo(path).fileName() == fileName;
		}), order.end());
	Persist();

	qCInfo(lcStore, "Deleted animation %s", qUtf8Printable(target));
	return true;
}

bool AnimationStore::DeleteFile(const QString &path)
{
	const QString target = NormalizePath(path);
	if (target.isEmpty())
		return false;

	if (QFileInfo(target).isFile())
		return RemoveAnimation(target);

	// Fall back to a file of the same name in either root
	const QString fileName = QFileInfo(target).fileName();
	for (const QString &root : {builtInRoot, userRoot}) {
		if (root.isEmpty())
			continue;

		const QString candidate = NormalizePath(QDir(root).filePath(fileName));
		if (QFileInfo(candidate).isFile()) {
			qCInfo(lcStore, "%s not found, deleting %s by name", qUtf8Printable(target),
				qUtf8Printable(candidate));
			return RemoveAnimation(candidate);
		}
	}

	qCWarning(lcStore, "No animation matches %s (%s)", qUtf8Printable(target),
		AnimationErrorName(AnimationError::NotFound));
	return false;
}

void AnimationStore::SetOrder(const QStringList &paths)
{
	order.clear();
	for (const QString &path : paths) {
		const QString normalized = NormalizePath(path);
		if (!normalized.isEmpty())
			order.append(normalized);
	}

	Persist();
}
