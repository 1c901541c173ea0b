#include "memo/cache/cache.hh"
#include "memo/cache/cache-settings.hh"
#include "memo/cache/segmented-cache.hh"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace memo {

TEST(CacheSettings, defaults)
{
    CacheSettings settings;
    ASSERT_EQ(settings.maxCapacity.get(), 10000u);
    ASSERT_EQ(settings.numSegments.get(), 1u);
    ASSERT_EQ(settings.workerThreads.get(), 0u);
    ASSERT_NO_THROW(settings.validate());
}

TEST(CacheSettings, applyConfig)
{
    CacheSettings settings;
    settings.applyConfig(R"(
        # a small cache
        max-capacity = 4K
        num-segments = 8
        cores = 3
    )");

    ASSERT_EQ(settings.maxCapacity.get(), 4096u);
    ASSERT_EQ(settings.numSegments.get(), 8u);
    ASSERT_EQ(settings.workerThreads.get(), 3u);
    ASSERT_TRUE(settings.workerThreads.isOverridden());
}

TEST(CacheSettings, initialValues)
{
    StringMap initials{{"max-capacity", "12"}};
    CacheSettings settings(initials);
    ASSERT_EQ(settings.maxCapacity.get(), 12u);
}

TEST(CacheSettings, invalidNumberIsRejected)
{
    CacheSettings settings;
    ASSERT_THROW(settings.applyConfig("max-capacity = lots"), UsageError);
}

TEST(CacheSettings, validateRejectsZeroSegments)
{
    CacheSettings settings;
    settings.numSegments = 0;
    ASSERT_THROW(settings.validate(), UsageError);
    ASSERT_THROW((SegmentedCache<int, int>(settings)), UsageError);
}

TEST(CacheSettings, toJSON)
{
    CacheSettings settings;
    auto json = settings.toJSON();
    ASSERT_TRUE(json.contains("max-capacity"));
    ASSERT_TRUE(json.contains("worker-threads"));
    ASSERT_FALSE(json.contains("cores"));
    ASSERT_EQ(json["max-capacity"]["value"], 10000);
    ASSERT_EQ(json["worker-threads"]["aliases"], nlohmann::json::array({"cores"}));
}

TEST(CacheSettings, configuresCache)
{
    CacheSettings settings;
    settings.maxCapacity = 2;
    settings.workerThreads = 1;

    Cache<int, int> cache(settings);
    ASSERT_EQ(cache.maxCapacity(), 2u);
    ASSERT_EQ(cache.getOrInsertWith(1, []() { return 10; }), 10);
    ASSERT_EQ(cache.getOrInsertWith(2, []() { return 20; }), 20);
    ASSERT_EQ(cache.getOrInsertWith(3, []() { return 30; }), 30);
    ASSERT_EQ(cache.entryCount(), 2u);
    ASSERT_EQ(cache.get(1), std::nullopt);
}

} // namespace memo
