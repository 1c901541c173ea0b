#include "memo/util/lru-cache.hh"

#include <gtest/gtest.h>

#include <string>

namespace memo {

/* ----------------------------------------------------------------------------
 * size
 * --------------------------------------------------------------------------*/

TEST(LRUCache, sizeOfEmptyCacheIsZero)
{
    LRUCache<std::string, std::string> c(10);
    ASSERT_EQ(c.size(), 0u);
    ASSERT_EQ(c.capacity(), 10u);
}

TEST(LRUCache, sizeOfSingleElementCacheIsOne)
{
    LRUCache<std::string, std::string> c(10);
    c.upsert("foo", "bar");
    ASSERT_EQ(c.size(), 1u);
}

/* ----------------------------------------------------------------------------
 * upsert / get
 * --------------------------------------------------------------------------*/

TEST(LRUCache, getFromEmptyCache)
{
    LRUCache<std::string, std::string> c(10);
    auto val = c.get("x");
    ASSERT_EQ(val.has_value(), false);
}

TEST(LRUCache, getExistingValue)
{
    LRUCache<std::string, std::string> c(10);
    c.upsert("foo", "bar");
    auto val = c.get("foo");
    ASSERT_EQ(val, "bar");
}

TEST(LRUCache, upsertOnZeroCapacityCache)
{
    LRUCache<std::string, std::string> c(0);
    c.upsert("foo", "bar");
    ASSERT_EQ(c.get("foo").has_value(), false);
    ASSERT_EQ(c.size(), 0u);
}

TEST(LRUCache, updateExistingValue)
{
    LRUCache<std::string, std::string> c(1);
    c.upsert("foo", "bar");
    ASSERT_EQ(c.get("foo").value_or("error"), "bar");

    c.upsert("foo", "changed");
    ASSERT_EQ(c.get("foo").value_or("error"), "changed");
    ASSERT_EQ(c.size(), 1u);
}

TEST(LRUCache, overwriteOldestWhenCapacityIsReached)
{
    LRUCache<std::string, std::string> c(3);
    c.upsert("one", "eins");
    c.upsert("two", "zwei");
    c.upsert("three", "drei");
    c.upsert("four", "vier");

    ASSERT_EQ(c.size(), 3u);
    ASSERT_EQ(c.get("one").has_value(), false);
    ASSERT_EQ(c.get("four").value_or("error"), "vier");
}

TEST(LRUCache, getPromotesEntry)
{
    LRUCache<int, int> c(2);
    c.upsert(1, 10);
    c.upsert(2, 20);

    // 1 is now the most recently used entry, so 2 gets retired.
    ASSERT_EQ(c.get(1), 10);
    c.upsert(3, 30);

    ASSERT_EQ(c.get(2).has_value(), false);
    ASSERT_EQ(c.get(1), 10);
    ASSERT_EQ(c.get(3), 30);
}

TEST(LRUCache, getOrNullptrReturnsMutablePointer)
{
    LRUCache<int, std::string> c(2);
    c.upsert(1, "one");

    ASSERT_EQ(c.getOrNullptr(2), nullptr);

    auto p = c.getOrNullptr(1);
    ASSERT_NE(p, nullptr);
    *p = "uno";
    ASSERT_EQ(c.get(1).value_or("error"), "uno");
}

/* ----------------------------------------------------------------------------
 * erase / eraseIf / clear
 * --------------------------------------------------------------------------*/

TEST(LRUCache, eraseFromEmptyCache)
{
    LRUCache<std::string, std::string> c(10);
    ASSERT_EQ(c.erase("foo"), false);
}

TEST(LRUCache, eraseExistingValue)
{
    LRUCache<std::string, std::string> c(10);
    c.upsert("foo", "bar");
    ASSERT_EQ(c.erase("foo"), true);
    ASSERT_EQ(c.size(), 0u);
}

TEST(LRUCache, eraseIfRemovesMatchingEntries)
{
    LRUCache<int, int> c(10);
    for (int i = 0; i < 10; ++i)
        c.upsert(i, i * i);

    auto removed = c.eraseIf([](const int & k, const int & v) { return k % 2 == 0 || v == 81; });

    ASSERT_EQ(removed, 6u);
    ASSERT_EQ(c.size(), 4u);
    ASSERT_EQ(c.get(1), 1);
    ASSERT_EQ(c.get(9).has_value(), false);
}

TEST(LRUCache, evictionStillWorksAfterEraseIf)
{
    LRUCache<int, int> c(3);
    c.upsert(1, 1);
    c.upsert(2, 2);
    c.upsert(3, 3);
    c.eraseIf([](const int & k, const int &) { return k == 1; });
    c.upsert(4, 4);
    c.upsert(5, 5);

    ASSERT_EQ(c.size(), 3u);
    ASSERT_EQ(c.get(2).has_value(), false);
    ASSERT_EQ(c.get(5), 5);
}

TEST(LRUCache, clearRemovesEverything)
{
    LRUCache<std::string, std::string> c(10);
    c.upsert("foo", "bar");
    c.upsert("bar", "xxx");
    c.clear();
    ASSERT_EQ(c.size(), 0u);
    ASSERT_EQ(c.get("foo").has_value(), false);
}

} // namespace memo
