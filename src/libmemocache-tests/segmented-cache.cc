#include "memo/cache/segmented-cache.hh"
#include "memo/cache/tests/gate.hh"

#include <gtest/gtest.h>

#include <atomic>
#include <bit>
#include <chrono>
#include <limits>
#include <memory>
#include <set>
#include <thread>
#include <vector>

namespace memo {

using namespace std::chrono_literals;
using testing::Gate;

TEST(SegmentedCache, segmentCountIsRoundedUpToAPowerOfTwo)
{
    ASSERT_EQ((SegmentedCache<int, int>(100, 1, make_ref<InlineScheduler>()).segmentCount()), 1u);
    ASSERT_EQ((SegmentedCache<int, int>(100, 3, make_ref<InlineScheduler>()).segmentCount()), 4u);
    ASSERT_EQ((SegmentedCache<int, int>(100, 8, make_ref<InlineScheduler>()).segmentCount()), 8u);
    ASSERT_EQ((SegmentedCache<int, int>(100, 9, make_ref<InlineScheduler>()).segmentCount()), 16u);
}

TEST(SegmentedCache, zeroSegmentsIsRejected)
{
    ASSERT_THROW((SegmentedCache<int, int>(100, 0, make_ref<InlineScheduler>())), UsageError);
}

TEST(SegmentedCache, segmentCountThatCannotBeRoundedUpIsRejected)
{
    using Cache = SegmentedCache<int, int>;

    ASSERT_TRUE(std::has_single_bit(Cache::maxSegments));
    ASSERT_THROW((Cache(100, std::numeric_limits<size_t>::max(), make_ref<InlineScheduler>())), UsageError);
    ASSERT_THROW((Cache(100, Cache::maxSegments + 1, make_ref<InlineScheduler>())), UsageError);
}

TEST(SegmentedCache, maxCapacityIsTheRequestedCapacity)
{
    SegmentedCache<int, int> cache(10, 3, make_ref<InlineScheduler>());
    ASSERT_EQ(cache.maxCapacity(), 10u);

    /* 4 segments of 2 entries. */
    for (int i = 0; i < 100; ++i)
        cache.insert(i, i);
    ASSERT_LE(cache.entryCount(), 8u);
}

TEST(SegmentedCache, routingIsStable)
{
    SegmentedCache<int, int> cache(1000, 8, make_ref<InlineScheduler>());

    std::set<size_t> used;
    for (int i = 0; i < 1000; ++i) {
        auto index = cache.segmentIndex(i);
        ASSERT_LT(index, cache.segmentCount());
        ASSERT_EQ(index, cache.segmentIndex(i));
        used.insert(index);
    }

    /* Consecutive integers must not all land in one segment. */
    ASSERT_GT(used.size(), 1u);
}

TEST(SegmentedCache, singleSegmentRoutesEverythingToZero)
{
    SegmentedCache<std::string, int> cache(10, 1, make_ref<InlineScheduler>());
    ASSERT_EQ(cache.segmentIndex("a"), 0u);
    ASSERT_EQ(cache.segmentIndex("zzz"), 0u);
}

TEST(SegmentedCache, basicSingleThread)
{
    SegmentedCache<std::string, std::string> cache(3, 1);

    cache.insert("a", "alice");
    cache.insert("b", "bob");
    ASSERT_EQ(cache.get("a"), "alice");
    ASSERT_EQ(cache.get("b"), "bob");

    cache.insert("c", "cindy");
    ASSERT_EQ(cache.get("c"), "cindy");

    /* Reading "a" leaves "b" as the least recently used entry. */
    ASSERT_EQ(cache.get("a"), "alice");
    cache.insert("d", "david");
    ASSERT_EQ(cache.get("b"), std::nullopt);
    ASSERT_EQ(cache.get("d"), "david");

    cache.invalidate("d");
    ASSERT_EQ(cache.get("d"), std::nullopt);
    ASSERT_EQ(cache.entryCount(), 2u);
}

TEST(SegmentedCache, invalidateAcrossSegments)
{
    SegmentedCache<int, int> cache(1000, 4, make_ref<InlineScheduler>());

    for (int i = 0; i < 100; ++i)
        cache.insert(i, i * 10);
    ASSERT_EQ(cache.entryCount(), 100u);

    auto removed = cache.invalidateEntriesIf([](const int & k, const int &) { return k % 2 == 0; });
    ASSERT_EQ(removed, 50u);
    ASSERT_EQ(cache.entryCount(), 50u);
    ASSERT_EQ(cache.get(3), 30);
    ASSERT_EQ(cache.get(4), std::nullopt);

    cache.invalidateAll();
    ASSERT_EQ(cache.entryCount(), 0u);
}

TEST(SegmentedCache, getOrInsertWithUsesTheKeysSegment)
{
    SegmentedCache<int, std::string> cache(1000, 4, make_ref<InlineScheduler>());

    ASSERT_EQ(cache.getOrInsertWith(7, []() { return std::string("seven"); }), "seven");
    ASSERT_EQ(cache.getOrInsertWith(7, []() -> std::string { throw Error("must not run"); }), "seven");
    ASSERT_EQ(cache.get(7), "seven");
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(SegmentedCache, getOrTryInsertWithRethrows)
{
    SegmentedCache<int, std::string> cache(1000, 4);

    ASSERT_THROW(cache.getOrTryInsertWith(1, []() -> std::string { throw Error("no such thing"); }), Error);
    ASSERT_EQ(cache.get(1), std::nullopt);
    ASSERT_EQ(cache.getOrTryInsertWith(1, []() { return std::string("one"); }), "one");
}

TEST(SegmentedCache, basicMultiThreads)
{
    const int numThreads = 16;
    const int numKeys = 32;

    SegmentedCache<int, int> cache(1000, 4);
    Gate start;
    auto invocations = std::make_shared<std::atomic<int>>(0);

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t)
        threads.emplace_back([&, t]() {
            start.wait();
            for (int i = 0; i < numKeys; ++i) {
                int key = (i + t) % numKeys;
                auto value = cache.getOrInsertWith(key, [key, invocations]() {
                    (*invocations)++;
                    std::this_thread::sleep_for(1ms);
                    return key * 100;
                });
                EXPECT_EQ(value, key * 100);
            }
        });

    start.open();
    for (auto & thread : threads)
        thread.join();

    ASSERT_EQ(invocations->load(), numKeys);
    ASSERT_EQ(cache.entryCount(), (size_t) numKeys);
    ASSERT_EQ(cache.pendingCount(), 0u);
}

TEST(SegmentedCache, fromSettings)
{
    CacheSettings settings;
    settings.applyConfig("max-capacity = 64\nnum-segments = 5\nworker-threads = 2\n");

    SegmentedCache<int, int> cache(settings);
    ASSERT_EQ(cache.segmentCount(), 8u);
    ASSERT_EQ(cache.maxCapacity(), 64u);
    ASSERT_EQ(cache.getOrInsertWith(1, []() { return 2; }), 2);
}

} // namespace memo
