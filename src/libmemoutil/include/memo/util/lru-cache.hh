#pragma once
///@file

#include <cassert>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>

namespace memo {

/**
 * A simple least-recently used cache. Not thread-safe.
 *
 * Entries live in a hash map; the recency order is a list of pointers
 * to the keys, which stay valid because unordered_map nodes never
 * move.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
class LRUCache
{
private:

    size_t capacity_;

    using LRU = std::list<const Key *>;

    using Data = std::unordered_map<Key, std::pair<typename LRU::iterator, Value>, Hash, KeyEqual>;

    Data data;
    LRU lru;

    /**
     * Move this item to the back of the LRU list.
     */
    void promote(typename LRU::iterator it)
    {
        lru.splice(/*pos=*/lru.end(), /*other=*/lru, it);
    }

    void retireOldest()
    {
        auto oldest = lru.begin();
        auto i = data.find(**oldest);
        assert(i != data.end());
        lru.erase(oldest);
        data.erase(i);
    }

public:

    LRUCache(size_t capacity)
        : capacity_(capacity)
    {
    }

    /**
     * Insert or upsert an item in the cache. The inserted item becomes
     * the most recently used one.
     */
    void upsert(const Key & key, const Value & value)
    {
        if (capacity_ == 0)
            return;

        erase(key);

        if (data.size() >= capacity_)
            retireOldest();

        auto res = data.emplace(key, std::make_pair(typename LRU::iterator(), value));
        assert(res.second);
        auto & i(res.first);

        i->second.first = lru.insert(lru.end(), &i->first);
    }

    bool erase(const Key & key)
    {
        auto i = data.find(key);
        if (i == data.end())
            return false;
        lru.erase(i->second.first);
        data.erase(i);
        return true;
    }

    /**
     * Remove every item for which `pred(key, value)` holds.
     *
     * @returns the number of items removed
     */
    template<typename Pred>
    size_t eraseIf(Pred && pred)
    {
        size_t removed = 0;
        for (auto i = data.begin(); i != data.end();) {
            if (pred(i->first, i->second.second)) {
                lru.erase(i->second.first);
                i = data.erase(i);
                removed++;
            } else
                ++i;
        }
        return removed;
    }

    /**
     * Look up an item in the cache. If it exists, it becomes the most
     * recently used item.
     *
     * @returns corresponding cache entry, std::nullopt if it's not in the cache
     */
    std::optional<Value> get(const Key & key)
    {
        auto i = data.find(key);
        if (i == data.end())
            return {};

        auto & [it, value] = i->second;
        promote(it);
        return value;
    }

    /**
     * Like `get()`, but returns a pointer into the cache, nullptr if
     * absent.
     */
    Value * getOrNullptr(const Key & key)
    {
        auto i = data.find(key);
        if (i == data.end())
            return nullptr;

        auto & [it, value] = i->second;
        promote(it);
        return &value;
    }

    size_t size() const noexcept
    {
        return data.size();
    }

    size_t capacity() const noexcept
    {
        return capacity_;
    }

    void clear() noexcept
    {
        data.clear();
        lru.clear();
    }
};

} // namespace memo
