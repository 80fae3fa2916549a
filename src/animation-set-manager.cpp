#include "animation-set-manager.hpp"
#include "animation-store.hpp"
#include "pet-logging.hpp"

#include <QFileInfo>
#include <QRandomGenerator>
#include <QSet>

AnimationSetManager::AnimationSetManager(AnimationStore *store_)
	: store(store_)
{
}

QStringList AnimationSetManager::GetOrderedList() const
{
	const std::vector<AnimationEntry> files = store->ListFiles();

	QSet<QString> available;
	for (const AnimationEntry &entry : files)
		available.insert(entry.path);

	// Saved order first, skipping anything no longer on disk
	QStringList ordered;
	QSet<QString> placed;
	for (const QString &path : store->GetOrder()) {
		if (!available.contains(path) || placed.contains(path))
			continue;
		ordered.append(path);
		placed.insert(path);
	}

	// Then everything else in discovery order
	for (const AnimationEntry &entry : files) {
		if (!placed.contains(entry.path))
			ordered.append(entry.path);
	}

	return ordered;
}

AnimationError AnimationSetManager::GetDefault(QString &path) const
{
	const QStringList list = GetOrderedList();
	if (list.isEmpty()) {
		qCWarning(lcManager, "No animation files found in %s or %s",
			qUtf8Printable(store->GetBuiltInRoot()), qUtf8Printable(store->GetUserRoot()));
		return AnimationError::EmptyCollection;
	}

	path = list.first();
	return AnimationError::None;
}

QString AnimationSetManager::SwitchToNext(const QString &currentPath) const
{
	const QStringList list = GetOrderedList();
	if (list.isEmpty())
		return QString();

	const int index = list.indexOf(AnimationStore::NormalizePath(currentPath));
	if (index >= 0)
		return list.at((index + 1) % list.size());

	const int random = QRandomGenerator::global()->bounded(static_cast<int>(list.size()));
	return list.at(random);
}

AnimationError AnimationSetManager::PrepareDelete(const QString &currentPath, DeletePlan &plan) const
{
	const QStringList list = GetOrderedList();
	if (list.size() <= 1) {
		qCInfo(lcManager, "Refusing to delete the last animation");
		return AnimationError::LastItemProtected;
	}

	if (currentPath.isEmpty())
		return AnimationError::NotFound;

	plan.target = AnimationStore::NormalizePath(currentPath);
	plan.fallback = SwitchToNext(plan.target);
	return AnimationError::None;
}

AnimationError AnimationSetManager::CommitDelete(const DeletePlan &plan, DeleteOutcome &outcome)
{
	outcome.deletedPath = plan.target;
	outcome.fallbackPath = plan.fallback;
	outcome.removed = store->DeleteFile(plan.target);

	// A name-based delete may have taken the fallback with it
	if (!QFileInfo(outcome.fallbackPath).isFile()) {
		const QStringList list = GetOrderedList();
		outcome.fallbackPath = list.isEmpty() ? QString() : list.first();
	}

	if (!outcome.removed) {
		qCWarning(lcManager, "Could not delete %s, falling back to %s",
			qUtf8Printable(plan.target), qUtf8Printable(outcome.fallbackPath));
		return AnimationError::NotFound;
	}

	return AnimationError::None;
}

AnimationError AnimationSetManager::RequestDelete(const QString &currentPath,
	const std::function<void(const QString &)> &releaseHandle, DeleteOutcome &outcome)
{
	DeletePlan plan;
	const AnimationError error = PrepareDelete(currentPath, plan);
	if (error != AnimationError::None)
		return error;

	if (releaseHandle)
		releaseHandle(plan.target);

	return CommitDelete(plan, outcome);
}

AnimationError AnimationSetManager::SetCustomOrder(const QStringList &paths)
{
	const QStringList current = GetOrderedList();
	if (paths.size() != current.size()) {
		qCWarning(lcManager, "Rejected order with %lld entries, expected %lld",
			static_cast<long long>(paths.size()), static_cast<long long>(current.size()));
		return AnimationError::InvalidOrder;
	}

	QSet<QString> remaining(current.begin(), current.end());
	QStringList resolved;
	for (const QString &path : paths) {
		const QString normalized = AnimationStore::NormalizePath(path);
		// remove() fails for unknown paths and for repeats
		if (!remaining.remove(normalized)) {
			qCWarning(lcManager, "Rejected order: %s is unknown or repeated",
				qUtf8Printable(normalized));
			return AnimationError::InvalidOrder;
		}
		resolved.append(normalized);
	}

	store->SetOrder(resolved);
	qCInfo(lcManager, "Custom order set for %lld animations", static_cast<long long>(resolved.size()));
	return AnimationError::None;
}

AnimationError AnimationSetManager::SetCustomOrderByIndices(const std::vector<int> &indices)
{
	const QStringList current = GetOrderedList();

	QStringList paths;
	for (int index : indices) {
		if (index < 0 || index >= current.size())
			return AnimationError::InvalidOrder;
		paths.append(current.at(index));
	}

	return SetCustomOrder(paths);
}

AnimationError AnimationSetManager::ParseOrderIndices(const QString &text, int count, std::vector<int> &indices)
{
	indices.clear();

	const QStringList parts = text.split(QLatin1Char(','));
	for (const QString &part : parts) {
		bool ok = false;
		const int number = part.trimmed().toInt(&ok);
		if (!ok || number < 1 || number > count) {
			indices.clear();
			return AnimationError::InvalidOrder;
		}
		indices.push_back(number - 1);
	}

	if (static_cast<int>(indices.size()) != count) {
		indices.clear();
		return AnimationError::InvalidOrder;
	}

	return AnimationError::None;
}

AnimationError AnimationSetManager::ImportAndActivate(const QString &sourcePath, QString &path)
{
	AnimationEntry entry;
	const AnimationError error = store->ImportFile(sourcePath, entry);
	if (error != AnimationError::None)
		return error;

	path = entry.path;
	return AnimationError::None;
}
