#pragma once

#include "animation-types.hpp"

#include <QString>
#include <QStringList>

#include <functional>
#include <vector>

class AnimationStore;

struct DeletePlan {
	QString target;
	QString fallback;
};

struct DeleteOutcome {
	QString deletedPath;
	QString fallbackPath;
	bool removed = false;
};

// Merged, ordered view over an AnimationStore. Holds no selection of its
// own; every call works from the current disk state and saved order.
class AnimationSetManager {
public:
	explicit AnimationSetManager(AnimationStore *store);

	QStringList GetOrderedList() const;
	AnimationError GetDefault(QString &path) const;

	// Next entry after currentPath, or a random one if currentPath is not
	// listed. Empty when there is nothing to show.
	QString SwitchToNext(const QString &currentPath) const;

	/*
	 * Deleting is two-phase. PrepareDelete refuses to remove the last
	 * animation and picks what to show next. The caller must then release
	 * any open handle on plan.target (stop the movie) before CommitDelete
	 * removes the file. outcome.fallbackPath is filled even when the
	 * removal fails.
	 */
	AnimationError PrepareDelete(const QString &currentPath, DeletePlan &plan) const;
	AnimationError CommitDelete(const DeletePlan &plan, DeleteOutcome &outcome);
	AnimationError RequestDelete(const QString &currentPath,
		const std::function<void(const QString &)> &releaseHandle, DeleteOutcome &outcome);

	// paths must be a permutation of GetOrderedList()
	AnimationError SetCustomOrder(const QStringList &paths);
	AnimationError SetCustomOrderByIndices(const std::vector<int> &indices);

	// Parses one-based "2,1,3" input into zero-based indices
	static AnimationError ParseOrderIndices(const QString &text, int count, std::vector<int> &indices);

	AnimationError ImportAndActivate(const QString &sourcePath, QString &path);

private:
	AnimationStore *store = nullptr;
};
