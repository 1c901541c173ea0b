#pragma once
///@file

#include "memo/cache/cache.hh"

#include <bit>
#include <cstdint>
#include <limits>
#include <vector>

namespace memo {

/**
 * A cache split into independently locked segments, each a `Cache`
 * with its own store and in-flight registry. A key always goes to the
 * same segment, chosen by the top bits of its mixed hash. All segments
 * share one scheduler.
 *
 * The number of segments is rounded up to a power of two, and
 * `maxCapacity` is divided evenly between them (rounding down).
 */
template<typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class SegmentedCache
{
    using Segment = Cache<K, V, Hash, KeyEqual>;

    size_t desiredCapacity;
    std::vector<Segment> segments;
    unsigned int segmentShift;
    Hash hasher;

    /* std::hash is the identity for integers, whose top bits would
       all select segment 0. */
    static uint64_t mix(uint64_t h)
    {
        h ^= h >> 30;
        h *= 0xbf58476d1ce4e5b9ULL;
        h ^= h >> 27;
        h *= 0x94d049bb133111ebULL;
        h ^= h >> 31;
        return h;
    }

    Segment & segmentFor(const K & key)
    {
        return segments[segmentIndex(key)];
    }

public:

    /**
     * The largest power of two a `size_t` can hold.
     */
    static constexpr size_t maxSegments = (std::numeric_limits<size_t>::max() >> 1) + 1;

    /**
     * @throws UsageError if `numSegments` is 0, or too large to be
     * rounded up to a power of two.
     */
    SegmentedCache(size_t maxCapacity, size_t numSegments, ref<Scheduler> scheduler)
        : desiredCapacity(maxCapacity)
    {
        if (numSegments == 0)
            throw UsageError("a segmented cache needs at least one segment");
        if (numSegments > maxSegments)
            throw UsageError("a segmented cache can have at most %d segments, not %d", maxSegments, numSegments);

        size_t actualSegments = std::bit_ceil(numSegments);
        segmentShift = 64 - std::countr_zero(actualSegments);

        size_t segmentCapacity = maxCapacity / actualSegments;

        segments.reserve(actualSegments);
        for (size_t i = 0; i < actualSegments; ++i)
            segments.emplace_back(make_ref<LRUStore<K, V, Hash, KeyEqual>>(segmentCapacity), scheduler);

        debug("created segmented cache with %d segments of %d entries", actualSegments, segmentCapacity);
    }

    explicit SegmentedCache(const CacheSettings & settings)
        : SegmentedCache(
              settings.maxCapacity.get(),
              settings.numSegments.get(),
              make_ref<ThreadPoolScheduler>(settings.workerThreads.get()))
    {
    }

    SegmentedCache(size_t maxCapacity, size_t numSegments)
        : SegmentedCache(maxCapacity, numSegments, make_ref<ThreadPoolScheduler>())
    {
    }

    size_t segmentCount() const
    {
        return segments.size();
    }

    size_t segmentIndex(const K & key) const
    {
        if (segmentShift == 64)
            return 0;
        return mix(hasher(key)) >> segmentShift;
    }

    /**
     * @see Cache::getOrInsertWith()
     */
    template<typename F>
        requires SelfContainedComputation<F, V>
    V getOrInsertWith(K key, F && init)
    {
        auto & segment = segmentFor(key);
        return segment.getOrInsertWith(std::move(key), std::forward<F>(init));
    }

    /**
     * @see Cache::getOrTryInsertWith()
     */
    template<typename F>
        requires SelfContainedComputation<F, V>
    V getOrTryInsertWith(K key, F && init)
    {
        auto & segment = segmentFor(key);
        return segment.getOrTryInsertWith(std::move(key), std::forward<F>(init));
    }

    std::optional<V> get(const K & key)
    {
        return segmentFor(key).get(key);
    }

    void insert(K key, V value)
    {
        auto & segment = segmentFor(key);
        segment.insert(std::move(key), std::move(value));
    }

    void invalidate(const K & key)
    {
        segmentFor(key).invalidate(key);
    }

    void invalidateAll()
    {
        for (auto & segment : segments)
            segment.invalidateAll();
    }

    size_t invalidateEntriesIf(fun<bool(const K &, const V &)> pred)
    {
        size_t removed = 0;
        for (auto & segment : segments)
            removed += segment.invalidateEntriesIf(pred);
        return removed;
    }

    /**
     * The capacity the cache was created with. The segments together
     * may hold slightly fewer entries.
     */
    size_t maxCapacity() const
    {
        return desiredCapacity;
    }

    size_t entryCount()
    {
        size_t n = 0;
        for (auto & segment : segments)
            n += segment.entryCount();
        return n;
    }

    size_t pendingCount()
    {
        size_t n = 0;
        for (auto & segment : segments)
            n += segment.pendingCount();
        return n;
    }

    size_t waiterCount(const K & key)
    {
        return segmentFor(key).waiterCount(key);
    }
};

} // namespace memo
