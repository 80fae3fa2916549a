#include "doctest/doctest.h"

#include <QFile>
#include <QFileInfo>
#include <QSet>

#include "animation-set-manager.hpp"
#include "animation-store.hpp"
#include "test-fixtures.hpp"

namespace {
struct ManagerFixture {
	PetDirs dirs;
	AnimationStore store;
	AnimationSetManager manager{&store};

	QString a;
	QString b;
	QString c;

	// a and b built in, c imported by the user
	void Populate()
	{
		a = dirs.WriteFile(dirs.builtInRoot, QStringLiteral("a.gif"));
		b = dirs.WriteFile(dirs.builtInRoot, QStringLiteral("b.gif"));
		c = dirs.WriteFile(dirs.userRoot, QStringLiteral("c.gif"));
		dirs.Init(store);
	}
};
}

TEST_CASE("GetOrderedList puts the custom order first and the rest in discovery order")
{
	ManagerFixture f;
	f.Populate();

	CHECK(f.manager.GetOrderedList() == QStringList({f.a, f.b, f.c}));

	f.store.SetOrder({f.c});
	CHECK(f.manager.GetOrderedList() == QStringList({f.c, f.a, f.b}));

	// Calling again on the same state gives the same answer
	CHECK(f.manager.GetOrderedList() == f.manager.GetOrderedList());
}

TEST_CASE("GetOrderedList skips ordered paths that are gone and never repeats")
{
	ManagerFixture f;
	f.Populate();
	f.store.SetOrder({f.b, f.a, f.b});

	REQUIRE(QFile::remove(f.a));

	const QStringList list = f.manager.GetOrderedList();
	CHECK(list == QStringList({f.b, f.c}));
	CHECK(QSet<QString>(list.begin(), list.end()).size() == list.size());
}

TEST_CASE("GetDefault reports an empty collection")
{
	ManagerFixture f;
	f.dirs.Init(f.store);

	QString path;
	CHECK(f.manager.GetDefault(path) == AnimationError::EmptyCollection);
	CHECK(path.isEmpty());
}

TEST_CASE("GetDefault returns the first entry of the ordered list")
{
	ManagerFixture f;
	f.Populate();
	f.store.SetOrder({f.b});

	QString path;
	REQUIRE(f.manager.GetDefault(path) == AnimationError::None);
	CHECK(path == f.b);
}

TEST_CASE("SwitchToNext cycles through the list")
{
	ManagerFixture f;
	f.Populate();

	CHECK(f.manager.SwitchToNext(f.a) == f.b);
	CHECK(f.manager.SwitchToNext(f.b) == f.c);
	CHECK(f.manager.SwitchToNext(f.c) == f.a);

	// Lookup is by normalized path
	CHECK(f.manager.SwitchToNext(f.dirs.builtInRoot + QStringLiteral("/./a.gif")) == f.b);
}

TEST_CASE("SwitchToNext picks a listed animation when the current one is unknown")
{
	ManagerFixture f;
	f.Populate();
	const QStringList list = f.manager.GetOrderedList();

	for (int i = 0; i < 20; i++) {
		CHECK(list.contains(f.manager.SwitchToNext(QString())));
		CHECK(list.contains(f.manager.SwitchToNext(QStringLiteral("/not/there.gif"))));
	}
}

TEST_CASE("SwitchToNext on an empty collection returns nothing")
{
	ManagerFixture f;
	f.dirs.Init(f.store);
	CHECK(f.manager.SwitchToNext(QStringLiteral("/x.gif")).isEmpty());
}

TEST_CASE("PrepareDelete protects the last animation without touching the disk")
{
	ManagerFixture f;
	const QString only = f.dirs.WriteFile(f.dirs.userRoot, QStringLiteral("only.gif"));
	f.dirs.Init(f.store);
	f.store.SetOrder({only});
	const QByteArray config = f.dirs.ReadConfig();

	DeletePlan plan;
	CHECK(f.manager.PrepareDelete(only, plan) == AnimationError::LastItemProtected);
	CHECK(f.manager.PrepareDelete(QString(), plan) == AnimationError::LastItemProtected);
	CHECK(plan.target.isEmpty());

	bool released = false;
	DeleteOutcome outcome;
	CHECK(f.manager.RequestDelete(only, [&](const QString &) { released = true; }, outcome) ==
	      AnimationError::LastItemProtected);

	CHECK_FALSE(released);
	CHECK(QFileInfo::exists(only));
	CHECK(f.dirs.ReadConfig() == config);
}

TEST_CASE("PrepareDelete needs a current animation")
{
	ManagerFixture f;
	f.Populate();

	DeletePlan plan;
	CHECK(f.manager.PrepareDelete(QString(), plan) == AnimationError::NotFound);
}

TEST_CASE("A delete plan keeps the confirmed path when the selection moves on")
{
	ManagerFixture f;
	f.Populate();

	// The pet confirms a, then an auto switch moves it to the next animation
	const QString confirmed = f.a;
	const QString playing = f.manager.SwitchToNext(confirmed);
	REQUIRE(playing == f.b);

	DeletePlan plan;
	REQUIRE(f.manager.PrepareDelete(confirmed, plan) == AnimationError::None);
	CHECK(plan.target == f.a);
	CHECK(plan.fallback == f.b);

	DeleteOutcome outcome;
	CHECK(f.manager.CommitDelete(plan, outcome) == AnimationError::None);
	CHECK(outcome.deletedPath == f.a);
	CHECK_FALSE(QFileInfo::exists(f.a));
	CHECK(QFileInfo::exists(f.b));
	CHECK(QFileInfo::exists(f.c));
}

TEST_CASE("RequestDelete releases the handle before removing the file")
{
	ManagerFixture f;
	f.Populate();

	bool existedWhenReleased = false;
	QString releasedPath;
	DeleteOutcome outcome;
	const AnimationError error = f.manager.RequestDelete(f.b,
		[&](const QString &path) {
			releasedPath = path;
			existedWhenReleased = QFileInfo::exists(path);
		},
		outcome);

	REQUIRE(error == AnimationError::None);
	CHECK(releasedPath == f.b);
	CHECK(existedWhenReleased);
	CHECK(outcome.removed);
	CHECK(outcome.deletedPath == f.b);
	CHECK(outcome.fallbackPath == f.c);
	CHECK_FALSE(QFileInfo::exists(f.b));
	CHECK(f.manager.GetOrderedList() == QStringList({f.a, f.c}));
}

TEST_CASE("CommitDelete still hands back a fallback when the file is already gone")
{
	ManagerFixture f;
	f.Populate();

	DeletePlan plan;
	REQUIRE(f.manager.PrepareDelete(f.c, plan) == AnimationError::None);
	CHECK(plan.fallback == f.a);

	REQUIRE(QFile::remove(f.c));

	DeleteOutcome outcome;
	CHECK(f.manager.CommitDelete(plan, outcome) == AnimationError::NotFound);
	CHECK_FALSE(outcome.removed);
	CHECK(outcome.fallbackPath == f.a);
}

TEST_CASE("SetCustomOrder accepts a permutation")
{
	ManagerFixture f;
	f.Populate();

	REQUIRE(f.manager.SetCustomOrder({f.c, f.a, f.b}) == AnimationError::None);
	CHECK(f.manager.GetOrderedList() == QStringList({f.c, f.a, f.b}));

	AnimationStore reloaded;
	f.dirs.Init(reloaded);
	AnimationSetManager reloadedManager(&reloaded);
	CHECK(reloadedManager.GetOrderedList() == QStringList({f.c, f.a, f.b}));
}

TEST_CASE("SetCustomOrder rejects anything but a permutation")
{
	ManagerFixture f;
	f.Populate();
	REQUIRE(f.manager.SetCustomOrder({f.b, f.c, f.a}) == AnimationError::None);
	const QByteArray config = f.dirs.ReadConfig();

	SUBCASE("missing entry")
	{
		CHECK(f.manager.SetCustomOrder({f.a, f.b}) == AnimationError::InvalidOrder);
	}
	SUBCASE("extra entry")
	{
		CHECK(f.manager.SetCustomOrder({f.a, f.b, f.c, f.a}) == AnimationError::InvalidOrder);
	}
	SUBCASE("duplicate entry")
	{
		CHECK(f.manager.SetCustomOrder({f.a, f.a, f.b}) == AnimationError::InvalidOrder);
	}
	SUBCASE("unknown entry")
	{
		CHECK(f.manager.SetCustomOrder({f.a, f.b, QStringLiteral("/elsewhere/c.gif")}) ==
		      AnimationError::InvalidOrder);
	}

	CHECK(f.dirs.ReadConfig() == config);
	CHECK(f.manager.GetOrderedList() == QStringList({f.b, f.c, f.a}));
}

TEST_CASE("SetCustomOrderByIndices reorders by position")
{
	ManagerFixture f;
	f.Populate();

	REQUIRE(f.manager.SetCustomOrderByIndices({2, 0, 1}) == AnimationError::None);
	CHECK(f.manager.GetOrderedList() == QStringList({f.c, f.a, f.b}));

	CHECK(f.manager.SetCustomOrderByIndices({0, 1, 3}) == AnimationError::InvalidOrder);
	CHECK(f.manager.SetCustomOrderByIndices({0, 0, 1}) == AnimationError::InvalidOrder);
}

TEST_CASE("ParseOrderIndices reads one-based comma separated numbers")
{
	std::vector<int> indices;

	REQUIRE(AnimationSetManager::ParseOrderIndices(QStringLiteral("2, 1,3"), 3, indices) == AnimationError::None);
	CHECK(indices == std::vector<int>({1, 0, 2}));

	CHECK(AnimationSetManager::ParseOrderIndices(QStringLiteral("1,x,3"), 3, indices) == AnimationError::InvalidOrder);
	CHECK(indices.empty());
	CHECK(AnimationSetManager::ParseOrderIndices(QStringLiteral("0,1,2"), 3, indices) == AnimationError::InvalidOrder);
	CHECK(AnimationSetManager::ParseOrderIndices(QStringLiteral("1,2,4"), 3, indices) == AnimationError::InvalidOrder);
	CHECK(AnimationSetManager::ParseOrderIndices(QStringLiteral("1,2"), 3, indices) == AnimationError::InvalidOrder);
	CHECK(AnimationSetManager::ParseOrderIndices(QString(), 3, indices) == AnimationError::InvalidOrder);
}

TEST_CASE("ImportAndActivate is idempotent")
{
	ManagerFixture f;
	f.dirs.Init(f.store);
	const QString source = f.dirs.Outside(QStringLiteral("jump.gif"));

	QString first;
	QString second;
	REQUIRE(f.manager.ImportAndActivate(source, first) == AnimationError::None);
	REQUIRE(f.manager.ImportAndActivate(source, second) == AnimationError::None);

	CHECK(first == second);
	CHECK(f.manager.GetOrderedList() == QStringList({first}));
}

TEST_CASE("ImportAndActivate reports a missing source")
{
	ManagerFixture f;
	f.dirs.Init(f.store);

	QString path;
	CHECK(f.manager.ImportAndActivate(f.dirs.tmp.filePath(QStringLiteral("missing.gif")), path) ==
	      AnimationError::NotFound);
	CHECK(path.isEmpty());
}

TEST_CASE("Import, reorder and delete down to the last animation")
{
	ManagerFixture f;
	f.dirs.Init(f.store);

	QString path;
	CHECK(f.manager.GetDefault(path) == AnimationError::EmptyCollection);

	QString first;
	REQUIRE(f.manager.ImportAndActivate(f.dirs.Outside(QStringLiteral("first.gif")), first) == AnimationError::None);
	REQUIRE(f.manager.GetDefault(path) == AnimationError::None);
	CHECK(path == first);

	QString second;
	REQUIRE(f.manager.ImportAndActivate(f.dirs.Outside(QStringLiteral("second.gif")), second) == AnimationError::None);
	REQUIRE(f.manager.SetCustomOrder({second, first}) == AnimationError::None);
	CHECK(f.manager.GetOrderedList() == QStringList({second, first}));

	DeleteOutcome outcome;
	REQUIRE(f.manager.RequestDelete(second, nullptr, outcome) == AnimationError::None);
	CHECK(outcome.fallbackPath == first);

	CHECK(f.manager.RequestDelete(first, nullptr, outcome) == AnimationError::LastItemProtected);
	CHECK(QFileInfo::exists(first));
}
