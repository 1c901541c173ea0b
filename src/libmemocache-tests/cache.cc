#include "memo/cache/cache.hh"
#include "memo/cache/tests/gate.hh"
#include "memo/cache/tests/manual-scheduler.hh"
#include "memo/cache/tests/mock-store.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace memo {

using namespace std::chrono_literals;
using testing::Gate;
using testing::ManualScheduler;
using testing::MockStore;

MakeError(LookupFailed, Error);

namespace {

/**
 * A computation that must never run.
 */
auto notInvoked()
{
    return []() -> std::string {
        ADD_FAILURE() << "computation was invoked";
        return "not invoked";
    };
}

} // namespace

/* ----------------------------------------------------------------------------
 * Plain operations
 * --------------------------------------------------------------------------*/

TEST(Cache, insertGetInvalidate)
{
    Cache<std::string, std::string> cache(3);

    cache.insert("a", "alice");
    cache.insert("b", "bob");
    ASSERT_EQ(cache.get("a"), "alice");
    ASSERT_EQ(cache.get("b"), "bob");
    ASSERT_EQ(cache.entryCount(), 2u);
    ASSERT_EQ(cache.maxCapacity(), 3u);

    cache.invalidate("b");
    ASSERT_EQ(cache.get("b"), std::nullopt);
    ASSERT_EQ(cache.entryCount(), 1u);
}

TEST(Cache, invalidateAll)
{
    Cache<std::string, std::string> cache(100);
    cache.insert("a", "alice");
    cache.insert("b", "bob");
    cache.insert("c", "cindy");

    cache.invalidateAll();
    cache.insert("d", "david");

    ASSERT_EQ(cache.get("a"), std::nullopt);
    ASSERT_EQ(cache.get("b"), std::nullopt);
    ASSERT_EQ(cache.get("c"), std::nullopt);
    ASSERT_EQ(cache.get("d"), "david");
}

TEST(Cache, invalidateEntriesIf)
{
    Cache<int, std::string> cache(100);
    cache.insert(0, "alice");
    cache.insert(1, "bob");
    cache.insert(2, "alex");

    StringSet names{"alice", "alex"};
    auto removed = cache.invalidateEntriesIf([names](const int &, const std::string & v) { return names.count(v) > 0; });

    ASSERT_EQ(removed, 2u);
    ASSERT_EQ(cache.get(0), std::nullopt);
    ASSERT_EQ(cache.get(1), "bob");
    ASSERT_EQ(cache.get(2), std::nullopt);
    ASSERT_EQ(cache.entryCount(), 1u);
}

TEST(Cache, copiesShareState)
{
    Cache<int, int> cache(10);
    auto copy = cache;
    copy.insert(1, 2);
    ASSERT_EQ(cache.get(1), 2);
}

TEST(Cache, basicMultiThreads)
{
    Cache<int, std::string> cache(100);
    std::vector<std::thread> threads;

    for (int id = 0; id < 4; ++id)
        threads.emplace_back([cache, id]() mutable {
            cache.insert(10, fmt("%d-100", id));
            cache.get(10);
            cache.insert(20, fmt("%d-200", id));
            cache.invalidate(10);
        });

    for (auto & t : threads)
        t.join();

    ASSERT_EQ(cache.get(10), std::nullopt);
    ASSERT_NE(cache.get(20), std::nullopt);
}

/* ----------------------------------------------------------------------------
 * getOrInsertWith
 * --------------------------------------------------------------------------*/

TEST(Cache, fastPathNeverInvokesTheComputation)
{
    Cache<int, std::string> cache(10);
    cache.insert(1, "stored");

    ASSERT_EQ(cache.getOrInsertWith(1, notInvoked()), "stored");
    ASSERT_EQ(cache.getOrTryInsertWith(1, notInvoked()), "stored");
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(Cache, absentKeyIsComputedAndStored)
{
    Cache<int, std::string> cache(10);

    ASSERT_EQ(cache.getOrInsertWith(1, []() { return std::string("computed"); }), "computed");
    ASSERT_EQ(cache.get(1), "computed");
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(Cache, twoThreadsShareOneComputation)
{
    Cache<int, std::string> cache(100);
    auto counter = std::make_shared<std::atomic<int>>(0);
    Gate bothStarted;
    std::atomic<int> arrived{0};

    auto call = [&]() {
        if (++arrived == 2)
            bothStarted.open();
        return cache.getOrInsertWith(42, [counter, bothStarted]() {
            bothStarted.wait();
            std::this_thread::sleep_for(50ms);
            (*counter)++;
            return std::string("x");
        });
    };

    std::string r1, r2;
    std::thread t1([&] { r1 = call(); });
    std::thread t2([&] { r2 = call(); });
    t1.join();
    t2.join();

    ASSERT_EQ(counter->load(), 1);
    ASSERT_EQ(r1, "x");
    ASSERT_EQ(r2, "x");
}

TEST(Cache, concurrentCallersShareOneComputation)
{
    Cache<std::string, int> cache(100);
    auto invocations = std::make_shared<std::atomic<int>>(0);
    Gate release;
    std::vector<std::thread> threads;
    std::vector<int> results(16, 0);

    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i]() {
            results[i] = cache.getOrInsertWith("key", [invocations, release]() {
                (*invocations)++;
                release.wait();
                return 7;
            });
        });

    EXPECT_TRUE(testing::eventually([&]() { return cache.waiterCount("key") == results.size(); }));
    EXPECT_EQ(invocations->load(), 1);
    EXPECT_EQ(cache.pendingCount(), 1u);
    release.open();

    for (auto & t : threads)
        t.join();

    ASSERT_EQ(invocations->load(), 1);
    for (auto r : results)
        ASSERT_EQ(r, 7);
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(Cache, independentKeysComputeInParallel)
{
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(100), make_ref<ThreadPoolScheduler>(4));
    Gate bothRunning;
    auto running = std::make_shared<std::atomic<int>>(0);

    auto compute = [&](int key) {
        return cache.getOrInsertWith(key, [running, bothRunning, key]() {
            if (++*running == 2)
                bothRunning.open();
            bothRunning.wait();
            return key * 10;
        });
    };

    int a = 0, b = 0;
    std::thread t1([&] { a = compute(1); });
    std::thread t2([&] { b = compute(2); });
    t1.join();
    t2.join();

    ASSERT_EQ(a, 10);
    ASSERT_EQ(b, 20);
}

TEST(Cache, throwingInfallibleComputationAbortsEveryCaller)
{
    auto scheduler = make_ref<ManualScheduler>();
    Cache<int, std::string> cache(make_ref<LRUStore<int, std::string>>(10), scheduler);

    std::vector<std::thread> threads;
    std::atomic<int> aborted{0};

    auto call = [&]() {
        try {
            cache.getOrInsertWith(1, []() -> std::string { throw LookupFailed("backend is down"); });
        } catch (ComputationAborted & e) {
            EXPECT_THAT(e.message(), ::testing::HasSubstr("backend is down"));
            aborted++;
        }
    };

    threads.emplace_back(call);
    scheduler->waitForQueued(1);
    for (int i = 0; i < 3; ++i)
        threads.emplace_back(call);
    EXPECT_TRUE(testing::eventually([&]() { return cache.waiterCount(1) == 4; }));

    EXPECT_TRUE(scheduler->runOne());
    for (auto & t : threads)
        t.join();

    ASSERT_EQ(aborted.load(), 4);
    ASSERT_EQ(scheduler->queued(), 0u);
    ASSERT_EQ(cache.get(1), std::nullopt);
    ASSERT_EQ(cache.pendingCount(), 0u);

    // The key can be computed again afterwards.
    std::thread retry([&] { EXPECT_EQ(cache.getOrInsertWith(1, []() { return std::string("ok"); }), "ok"); });
    scheduler->waitForQueued(1);
    scheduler->runOne();
    retry.join();
    ASSERT_EQ(cache.get(1), "ok");
}

TEST(Cache, refusedWorkAbortsTheEntry)
{
    auto scheduler = make_ref<ManualScheduler>();
    scheduler->refuse();
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(10), scheduler);

    ASSERT_THROW(cache.getOrInsertWith(1, []() { return 1; }), ComputationAborted);
    ASSERT_EQ(cache.get(1), std::nullopt);
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(Cache, shutDownThreadPoolAbortsTheEntry)
{
    auto scheduler = make_ref<ThreadPoolScheduler>(2);
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(10), scheduler);

    ASSERT_EQ(cache.getOrInsertWith(1, []() { return 1; }), 1);

    scheduler->shutdown();

    ASSERT_THROW(cache.getOrInsertWith(2, []() { return 2; }), ComputationAborted);
    ASSERT_EQ(cache.get(2), std::nullopt);
    ASSERT_EQ(cache.pendingCount(), 0u);

    // Committed entries are still served.
    ASSERT_EQ(cache.getOrInsertWith(1, []() { return 100; }), 1);
}

TEST(Cache, droppedWorkAbortsTheEntry)
{
    auto scheduler = make_ref<ManualScheduler>();
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(10), scheduler);
    std::atomic<bool> aborted{false};

    std::thread caller([&] {
        try {
            cache.getOrInsertWith(1, []() { return 1; });
        } catch (ComputationAborted &) {
            aborted = true;
        }
    });

    scheduler->waitForQueued(1);
    scheduler->dropAll();
    caller.join();

    ASSERT_TRUE(aborted);
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(Cache, publicationDoesNotDependOnTheCaller)
{
    auto scheduler = make_ref<ManualScheduler>();
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(10), scheduler);

    std::thread caller([&] { EXPECT_EQ(cache.getOrInsertWith(1, []() { return 5; }), 5); });
    scheduler->waitForQueued(1);

    /* The work item is run from a thread that never called the cache. */
    std::thread worker([&] { scheduler->runOne(); });
    worker.join();
    caller.join();

    ASSERT_EQ(cache.get(1), 5);
}

TEST(Cache, computationOutlivesItsCallersFrame)
{
    Cache<int, std::string> cache(10);

    auto start = [&]() {
        std::string local = "built from a local";
        return cache.getOrInsertWith(1, makeComputation([](std::string s) { return s + "!"; }, local));
    };

    ASSERT_EQ(start(), "built from a local!");
}

TEST(Cache, inlineSchedulerRunsOnTheCallingThread)
{
    Cache<int, std::thread::id> cache(make_ref<LRUStore<int, std::thread::id>>(10), make_ref<InlineScheduler>());

    ASSERT_EQ(cache.getOrInsertWith(1, []() { return std::this_thread::get_id(); }), std::this_thread::get_id());
}

TEST(Cache, storeIsWrittenBeforeWaitersAreReleased)
{
    using ::testing::InSequence;
    using ::testing::Invoke;

    auto store = make_ref<::testing::NiceMock<MockStore<int, std::string>>>();
    Cache<int, std::string> cache(store, make_ref<InlineScheduler>());

    {
        InSequence seq;
        // Initial lookup and the initiator's re-check.
        EXPECT_CALL(*store, lookup(7)).Times(2);
        EXPECT_CALL(*store, insert(7, std::string("seven"))).WillOnce(Invoke([&](const int & k, const std::string & v) {
            // The pending entry is still registered while the value is written.
            EXPECT_EQ(cache.pendingCount(), 1u);
            store->real.insert(k, v);
        }));
    }

    ASSERT_EQ(cache.getOrInsertWith(7, []() { return std::string("seven"); }), "seven");
    ASSERT_EQ(cache.pendingCount(), 0u);
    ASSERT_EQ(store->real.lookup(7), "seven");
}

TEST(Cache, failingStoreAbortsTheEntry)
{
    using ::testing::_;
    using ::testing::Throw;

    auto store = make_ref<::testing::NiceMock<MockStore<int, int>>>();
    Cache<int, int> cache(store, make_ref<InlineScheduler>());

    EXPECT_CALL(*store, insert(_, _)).WillOnce(Throw(SysError(ENOSPC, "writing entry")));

    ASSERT_THROW(cache.getOrTryInsertWith(1, []() { return 1; }), ComputationAborted);
    ASSERT_EQ(cache.pendingCount(), 0u);
}

/**
 * One key seen through a whole computation: a second caller attaches
 * while the first one's computation is queued, a reader finds nothing
 * meanwhile, and callers arriving after completion find the value.
 */
TEST(Cache, getOrInsertWithTimeline)
{
    auto scheduler = make_ref<ManualScheduler>();
    Cache<unsigned int, std::string> cache(make_ref<LRUStore<unsigned int, std::string>>(100), scheduler);
    static constexpr unsigned int key = 0;

    std::thread first([cache]() mutable {
        EXPECT_EQ(cache.getOrInsertWith(key, []() { return std::string("thread1"); }), "thread1");
    });
    scheduler->waitForQueued(1);

    std::thread second([cache]() mutable { EXPECT_EQ(cache.getOrInsertWith(key, notInvoked()), "thread1"); });
    EXPECT_TRUE(testing::eventually([&]() { return cache.waiterCount(key) == 2; }));

    EXPECT_EQ(cache.get(key), std::nullopt);
    EXPECT_EQ(cache.pendingCount(), 1u);

    EXPECT_TRUE(scheduler->runOne());
    first.join();
    second.join();

    ASSERT_EQ(cache.pendingCount(), 0u);
    ASSERT_EQ(cache.get(key), "thread1");
    ASSERT_EQ(cache.getOrInsertWith(key, notInvoked()), "thread1");
    ASSERT_EQ(scheduler->queued(), 0u);
}

/* ----------------------------------------------------------------------------
 * getOrTryInsertWith
 * --------------------------------------------------------------------------*/

TEST(Cache, failureIsRethrownToEveryCallerAndNothingIsStored)
{
    auto scheduler = make_ref<ManualScheduler>();
    Cache<int, std::string> cache(make_ref<LRUStore<int, std::string>>(10), scheduler);

    std::vector<std::thread> threads;
    std::mutex seenLock;
    std::vector<const LookupFailed *> seen;

    auto call = [&]() {
        try {
            cache.getOrTryInsertWith(1, []() -> std::string { throw LookupFailed("no such user"); });
            ADD_FAILURE() << "expected LookupFailed";
        } catch (LookupFailed & e) {
            EXPECT_EQ(e.message(), "no such user");
            std::lock_guard<std::mutex> guard(seenLock);
            seen.push_back(&e);
        }
    };

    threads.emplace_back(call);
    scheduler->waitForQueued(1);
    for (int i = 0; i < 3; ++i)
        threads.emplace_back(call);
    EXPECT_TRUE(testing::eventually([&]() { return cache.waiterCount(1) == 4; }));

    scheduler->runOne();
    for (auto & t : threads)
        t.join();

    ASSERT_EQ(seen.size(), 4u);
    // Every caller saw the very same exception object.
    for (auto e : seen)
        ASSERT_EQ(e, seen.front());

    ASSERT_EQ(cache.get(1), std::nullopt);
    ASSERT_EQ(cache.pendingCount(), 0u);
    ASSERT_EQ(scheduler->queued(), 0u);
}

TEST(Cache, interruptedFallibleComputationIsAborted)
{
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(10), make_ref<InlineScheduler>());

    ASSERT_THROW(
        cache.getOrTryInsertWith(1, []() -> int { throw Interrupted("interrupted"); }), ComputationAborted);
    ASSERT_EQ(cache.get(1), std::nullopt);
}

/**
 * A failing computation and the recomputation after it: both callers
 * of the failed one see the failure, nothing is stored, and the next
 * caller starts over and shares its value with a late attacher.
 */
TEST(Cache, getOrTryInsertWithTimeline)
{
    auto scheduler = make_ref<ManualScheduler>();
    Cache<unsigned int, std::string> cache(make_ref<LRUStore<unsigned int, std::string>>(100), scheduler);
    static constexpr unsigned int key = 0;

    std::thread first([cache]() mutable {
        EXPECT_THROW(
            cache.getOrTryInsertWith(key, []() -> std::string { throw LookupFailed("thread1 error"); }),
            LookupFailed);
    });
    scheduler->waitForQueued(1);

    std::thread second([cache]() mutable {
        EXPECT_THROW(cache.getOrTryInsertWith(key, notInvoked()), LookupFailed);
    });
    EXPECT_TRUE(testing::eventually([&]() { return cache.waiterCount(key) == 2; }));
    EXPECT_EQ(cache.get(key), std::nullopt);

    EXPECT_TRUE(scheduler->runOne());
    first.join();
    second.join();

    EXPECT_EQ(cache.get(key), std::nullopt);
    EXPECT_EQ(cache.pendingCount(), 0u);

    std::thread third([cache]() mutable {
        EXPECT_EQ(cache.getOrTryInsertWith(key, []() { return std::string("thread3"); }), "thread3");
    });
    scheduler->waitForQueued(1);

    std::thread fourth([cache]() mutable { EXPECT_EQ(cache.getOrTryInsertWith(key, notInvoked()), "thread3"); });
    EXPECT_TRUE(testing::eventually([&]() { return cache.waiterCount(key) == 2; }));
    EXPECT_EQ(cache.get(key), std::nullopt);

    EXPECT_TRUE(scheduler->runOne());
    third.join();
    fourth.join();

    ASSERT_EQ(cache.getOrTryInsertWith(key, notInvoked()), "thread3");
    ASSERT_EQ(cache.get(key), "thread3");
    ASSERT_EQ(scheduler->queued(), 0u);
}

/**
 * The waiters of a failed computation all hold the same exception
 * object and may inspect it at the same time.
 */
TEST(Cache, sharedFailureCanBeReadConcurrently)
{
    auto scheduler = make_ref<ManualScheduler>();
    Cache<int, std::string> cache(make_ref<LRUStore<int, std::string>>(10), scheduler);
    const size_t numCallers = 8;

    Gate inspect;
    std::atomic<size_t> caught{0};
    std::mutex resultsLock;
    std::vector<std::pair<const char *, std::string>> results;

    auto call = [&]() {
        try {
            cache.getOrTryInsertWith(1, []() -> std::string { throw LookupFailed("user '%s' not found", "alice"); });
            ADD_FAILURE() << "expected LookupFailed";
        } catch (LookupFailed & e) {
            caught++;
            inspect.wait();
            auto what = e.what();
            auto message = e.message();
            std::lock_guard<std::mutex> guard(resultsLock);
            results.emplace_back(what, message);
        }
    };

    std::vector<std::thread> threads;
    threads.emplace_back(call);
    scheduler->waitForQueued(1);
    for (size_t i = 1; i < numCallers; ++i)
        threads.emplace_back(call);
    EXPECT_TRUE(testing::eventually([&]() { return cache.waiterCount(1) == numCallers; }));

    EXPECT_TRUE(scheduler->runOne());
    EXPECT_TRUE(testing::eventually([&]() { return caught == numCallers; }));
    inspect.open();

    for (auto & t : threads)
        t.join();

    ASSERT_EQ(results.size(), numCallers);
    for (auto & [what, message] : results) {
        // The text was formatted once, before the waiters got it.
        ASSERT_EQ(what, results.front().first);
        ASSERT_THAT(message, ::testing::HasSubstr("not found"));
        ASSERT_THAT(std::string(what), ::testing::HasSubstr(message));
    }
}

/* ----------------------------------------------------------------------------
 * Nested use
 * --------------------------------------------------------------------------*/

TEST(Cache, computationMayAskForAnotherKey)
{
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(10), make_ref<ThreadPoolScheduler>(1));

    auto outer = cache.getOrInsertWith(1, [cache]() mutable {
        return cache.getOrInsertWith(2, []() { return 20; }) + 1;
    });

    ASSERT_EQ(outer, 21);
    ASSERT_EQ(cache.get(2), 20);
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(Cache, nestedComputationsShareTheWorker)
{
    auto scheduler = make_ref<ThreadPoolScheduler>(1);
    Cache<int, int> cache(make_ref<LRUStore<int, int>>(10), scheduler);

    auto depth = cache.getOrInsertWith(3, [cache]() mutable {
        return cache.getOrInsertWith(2, [cache]() mutable {
            return cache.getOrInsertWith(1, []() { return 1; }) + 1;
        }) + 1;
    });

    ASSERT_EQ(depth, 3);
    ASSERT_EQ(scheduler->workerCount(), 1u);
    ASSERT_EQ(cache.entryCount(), 3u);
}

TEST(Cache, isASingleSegment)
{
    Cache<int, int> cache(10);
    ASSERT_EQ(cache.segmentCount(), 1u);
}

} // namespace memo
