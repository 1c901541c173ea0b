#pragma once
///@file

#include "memo/util/configuration.hh"

#include <cstdint>

namespace memo {

struct CacheSettings : Config
{
    using Config::Config;

    Setting<uint64_t> maxCapacity{
        this,
        10000,
        "max-capacity",
        R"(
          The maximum number of entries the cache keeps. When the cache is
          full, the least recently used entry is evicted. Accepts the unit
          suffixes `K`, `M`, `G` and `T`.
        )"};

    Setting<unsigned int> numSegments{
        this,
        1,
        "num-segments",
        R"(
          The number of independently locked segments of a segmented
          cache. Rounded up to the next power of two; must be at least 1.
        )"};

    Setting<unsigned int> workerThreads{
        this,
        0,
        "worker-threads",
        R"(
          The maximum number of threads that run computations. 0 means
          one per hardware thread.
        )",
        {"cores"}};

    /**
     * Check the settings for consistency.
     *
     * @throws UsageError
     */
    void validate() const;
};

} // namespace memo
