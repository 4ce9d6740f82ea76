#include <floem/reactive.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace floem::reactive;

class ReactiveTest : public ::testing::Test {
protected:
  RuntimeGuard runtime_;
};

TEST_F(ReactiveTest, SetReRunsEverySubscriberBeforeReturning) {
  auto s = create_rw_signal(1);
  int e1 = 0;
  int e2 = 0;
  create_effect([&] {
    s.get();
    ++e1;
  });
  create_effect([&] {
    s.get();
    ++e2;
  });
  ASSERT_EQ(e1, 1);
  ASSERT_EQ(e2, 1);

  s.set(7);
  EXPECT_EQ(e1, 2);
  EXPECT_EQ(e2, 2);
  EXPECT_EQ(s.get_untracked(), 7);
}

TEST_F(ReactiveTest, SubscribersRunInSubscriptionOrder) {
  auto s = create_rw_signal(0);
  std::vector<int> order;
  for (int i = 0; i < 4; ++i) {
    create_effect([&, i] {
      s.track();
      order.push_back(i);
    });
  }
  order.clear();
  s.set(1);
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(ReactiveTest, EffectDropsDependenciesItNoLongerReads) {
  auto use_a = create_rw_signal(true);
  auto a = create_rw_signal(1);
  auto b = create_rw_signal(2);
  int runs = 0;
  create_effect([&] {
    ++runs;
    if (use_a.get()) {
      a.get();
    } else {
      b.get();
    }
  });
  ASSERT_EQ(runs, 1);

  b.set(3);
  EXPECT_EQ(runs, 1);

  use_a.set(false);
  EXPECT_EQ(runs, 2);

  a.set(10);
  EXPECT_EQ(runs, 2);
  b.set(4);
  EXPECT_EQ(runs, 3);
}

TEST_F(ReactiveTest, EffectReceivesPreviousValue) {
  auto s = create_rw_signal(1);
  std::vector<std::optional<int>> seen;
  create_effect<int>([&](std::optional<int> prev) {
    seen.push_back(prev);
    return s.get() * 10;
  });
  s.set(2);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_FALSE(seen[0].has_value());
  EXPECT_EQ(seen[1], 10);
}

TEST_F(ReactiveTest, UntrackedReadsDoNotSubscribe) {
  auto s = create_rw_signal(1);
  int runs = 0;
  create_effect([&] {
    ++runs;
    s.get_untracked();
    untrack([&] { return s.get(); });
    s.with_untracked([](const int &) {});
  });
  s.set(2);
  EXPECT_EQ(runs, 1);
}

TEST_F(ReactiveTest, WriteToOwnDependencyRerunsNested) {
  auto s = create_rw_signal(0);
  int runs = 0;
  create_effect([&] {
    ++runs;
    const int v = s.get();
    if (v < 3) {
      s.set(v + 1);
    }
  });
  EXPECT_EQ(s.get_untracked(), 3);
  EXPECT_EQ(runs, 4);

  // The outer run still tracks after the nested ones finished.
  s.set(0);
  EXPECT_EQ(s.get_untracked(), 3);
}

TEST_F(ReactiveTest, UpdateMutatesInPlace) {
  auto s = create_rw_signal(std::vector<int>{1});
  int runs = 0;
  create_effect([&] {
    s.with([](const std::vector<int> &) {});
    ++runs;
  });
  s.update([](std::vector<int> &v) { v.push_back(2); });
  EXPECT_EQ(runs, 2);
  EXPECT_EQ(s.get_untracked().size(), 2u);
}

TEST_F(ReactiveTest, SplitHandlesShareOneSignal) {
  auto [read, write] = create_signal(std::string{"a"});
  write.set("b");
  EXPECT_EQ(read.get(), "b");

  auto rw = create_rw_signal(1);
  EXPECT_EQ(rw.read_only().id(), rw.id());
  EXPECT_EQ(rw.write_only().id(), rw.id());
}

TEST_F(ReactiveTest, DisposedSignalAccess) {
  auto s = create_rw_signal(5);
  const auto id = s.id();
  EXPECT_TRUE(id.has_signal());
  s.dispose();

  EXPECT_FALSE(id.has_signal());
  EXPECT_TRUE(s.is_disposed());
  EXPECT_FALSE(s.try_get().has_value());
  EXPECT_THROW(s.get(), SignalDisposed);
  EXPECT_FALSE(s.try_set(1));
  EXPECT_FALSE(s.try_update([](int &v) { ++v; }));
  EXPECT_NO_THROW(s.set(2));
  EXPECT_TRUE(s.try_with([](const int *v) { return v == nullptr; }));
}

TEST_F(ReactiveTest, DisposingSignalDisposesSubscribedEffects) {
  auto s = create_rw_signal(1);
  auto other = create_rw_signal(1);
  int runs = 0;
  create_effect([&] {
    s.try_get();
    other.get();
    ++runs;
  });
  const auto effects = runtime_.runtime().effect_count();
  s.dispose();
  EXPECT_EQ(runtime_.runtime().effect_count(), effects - 1);
  other.set(2);
  EXPECT_EQ(runs, 1);
}

TEST_F(ReactiveTest, ReadingWhileMutatingIsABorrowError) {
  auto s = create_rw_signal(1);
  EXPECT_THROW(s.update([&](int &) { s.get_untracked(); }), BorrowError);
  // The flag is released after the throw.
  EXPECT_EQ(s.get_untracked(), 1);
}

TEST_F(ReactiveTest, MemoOnlyNotifiesOnChange) {
  auto n = create_rw_signal(2);
  int computes = 0;
  auto parity = create_memo<int>([&](const int *) {
    ++computes;
    return n.get() % 2;
  });
  int downstream = 0;
  create_effect([&] {
    parity.get();
    ++downstream;
  });
  ASSERT_EQ(downstream, 1);
  EXPECT_EQ(parity.get_untracked(), 0);

  const int before = computes;
  n.set(4);
  EXPECT_EQ(computes, before + 1);
  EXPECT_EQ(downstream, 1);

  n.set(5);
  EXPECT_EQ(parity.get_untracked(), 1);
  EXPECT_EQ(downstream, 2);
}

TEST_F(ReactiveTest, MemoSeesPreviousValue) {
  auto n = create_rw_signal(1);
  auto running_max = create_memo<int>([&](const int *prev) {
    const int v = n.get();
    return prev && *prev > v ? *prev : v;
  });
  n.set(5);
  n.set(3);
  EXPECT_EQ(running_max.get_untracked(), 5);
}

TEST_F(ReactiveTest, TriggerNotifiesTrackers) {
  auto t = create_trigger();
  int runs = 0;
  create_effect([&] {
    t.track();
    ++runs;
  });
  t.notify();
  t.notify();
  EXPECT_EQ(runs, 3);
}

TEST_F(ReactiveTest, UpdaterReportsLaterValues) {
  auto s = create_rw_signal(1);
  std::vector<int> changes;
  const int initial = create_updater([&] { return s.get() * 2; },
                                     [&](int v) { changes.push_back(v); });
  EXPECT_EQ(initial, 2);
  EXPECT_TRUE(changes.empty());
  s.set(3);
  s.set(4);
  EXPECT_EQ(changes, (std::vector<int>{6, 8}));
}

TEST_F(ReactiveTest, UpdaterCallbackIsUntracked) {
  auto s = create_rw_signal(1);
  auto other = create_rw_signal(0);
  int computes = 0;
  create_updater(
      [&] {
        ++computes;
        return s.get();
      },
      [&](int) { other.get(); });
  s.set(2);
  const int before = computes;
  other.set(1);
  EXPECT_EQ(computes, before);
}

TEST_F(ReactiveTest, StatefulUpdaterThreadsItsState) {
  auto s = create_rw_signal(1);
  std::vector<std::pair<int, int>> calls;
  const int initial = create_stateful_updater<int>(
      [&](std::optional<int> prev) {
        return std::pair{s.get() * 10, prev.value_or(0) + 1};
      },
      [&](int result, int count) {
        calls.emplace_back(result, count);
        return count * 100;
      });
  EXPECT_EQ(initial, 10);
  EXPECT_TRUE(calls.empty());

  s.set(2);
  s.set(3);
  EXPECT_EQ(calls, (std::vector<std::pair<int, int>>{{20, 2}, {30, 201}}));
}

TEST_F(ReactiveTest, DerivedSignalMapsBothWays) {
  auto cents = create_rw_signal(250);
  const auto dollars = create_derived_rw_signal(
      cents, [](const int &c) { return c / 100.0; },
      [](const double &d) { return static_cast<int>(std::lround(d * 100.0)); });
  EXPECT_EQ(dollars.id(), cents.id());
  EXPECT_DOUBLE_EQ(dollars.get_untracked(), 2.5);

  std::vector<double> seen;
  create_effect([&] { seen.push_back(dollars.get()); });
  dollars.set(4.0);
  EXPECT_EQ(cents.get_untracked(), 400);
  dollars.update([](double &d) { d += 0.25; });
  EXPECT_EQ(cents.get_untracked(), 425);
  EXPECT_EQ(seen, (std::vector<double>{2.5, 4.0, 4.25}));
  EXPECT_TRUE(dollars.with_untracked([](const double &d) { return d > 4.0; }));

  cents.dispose();
  EXPECT_TRUE(dollars.is_disposed());
  EXPECT_FALSE(dollars.try_get().has_value());
  EXPECT_FALSE(dollars.try_set(1.0));
}

TEST_F(ReactiveTest, TrackerCallsOnChangeInsteadOfRerunning) {
  auto a = create_rw_signal(1);
  auto b = create_rw_signal(10);
  int changes = 0;
  int tracked_runs = 0;
  const auto tracker = create_tracker([&] { ++changes; });

  const int sum = tracker.track([&] {
    ++tracked_runs;
    return a.get() + b.get_untracked();
  });
  EXPECT_EQ(sum, 11);

  b.set(11);
  EXPECT_EQ(changes, 0);
  a.set(2);
  EXPECT_EQ(changes, 1);
  EXPECT_EQ(tracked_runs, 1);

  a.set(3);
  EXPECT_EQ(changes, 1);

  tracker.track([&] { a.track(); });
  a.set(4);
  EXPECT_EQ(changes, 2);
}

TEST_F(ReactiveTest, DestroyingATrackerDropsItsSubscriptions) {
  auto a = create_rw_signal(0);
  int changes = 0;
  {
    auto tracker = create_tracker([&] { ++changes; });
    auto moved = std::move(tracker);
    EXPECT_EQ(tracker.id().raw, 0u);
    moved.track([&] { a.get(); });
    EXPECT_EQ(runtime_.runtime().effect_count(), 1u);
  }
  a.set(1);
  EXPECT_EQ(changes, 0);
  EXPECT_EQ(runtime_.runtime().effect_count(), 0u);
}

TEST_F(ReactiveTest, BaseSignalDisposesOnDestruction) {
  Id id;
  int runs = 0;
  {
    BaseSignal<int> owned{1};
    id = owned.id();
    create_effect([&, r = owned.read_only()] {
      r.try_get();
      ++runs;
    });
    owned.set(2);
    EXPECT_EQ(runs, 2);
    EXPECT_TRUE(id.has_signal());
  }
  EXPECT_FALSE(id.has_signal());
}

TEST_F(ReactiveTest, BaseSignalMoveTransfersOwnership) {
  BaseSignal<int> a{1};
  const auto id = a.id();
  BaseSignal<int> b{std::move(a)};
  EXPECT_EQ(b.id(), id);
  EXPECT_EQ(a.id().raw, 0u);
  EXPECT_EQ(b.get(), 1);
}

TEST_F(ReactiveTest, ContextIsOneValuePerType) {
  EXPECT_FALSE(use_context<int>().has_value());
  provide_context(3);
  provide_context(std::string{"theme"});
  EXPECT_EQ(use_context<int>(), 3);
  provide_context(4);
  EXPECT_EQ(use_context<int>(), 4);
  EXPECT_EQ(use_context<std::string>(), std::string{"theme"});
  EXPECT_FALSE(use_context<double>().has_value());
}

TEST(RuntimeGuard, RuntimesAreIndependent) {
  Id id;
  {
    RuntimeGuard outer;
    auto s = create_rw_signal(1);
    id = s.id();
    {
      RuntimeGuard inner;
      EXPECT_FALSE(id.has_signal());
    }
    EXPECT_TRUE(id.has_signal());
  }
}
