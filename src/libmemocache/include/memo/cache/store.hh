#pragma once
///@file

#include "memo/util/fun.hh"
#include "memo/util/lru-cache.hh"
#include "memo/util/sync.hh"

#include <functional>
#include <optional>

namespace memo {

/**
 * The storage engine that holds committed entries. Implementations
 * must be safe to call from any thread. Which entries are kept when
 * the store is full is up to the implementation.
 */
template<typename K, typename V>
struct Store
{
    virtual ~Store() = default;

    virtual std::optional<V> lookup(const K & key) = 0;

    virtual void insert(const K & key, const V & value) = 0;

    /**
     * @returns whether `key` was present.
     */
    virtual bool remove(const K & key) = 0;

    /**
     * Remove every entry for which `pred` holds.
     *
     * @returns the number of entries removed.
     */
    virtual size_t removeIf(fun<bool(const K &, const V &)> pred) = 0;

    virtual void clear() = 0;

    virtual size_t size() = 0;

    /**
     * The maximum number of entries the store keeps.
     */
    virtual size_t capacity() = 0;
};

/**
 * A `Store` that evicts the least recently used entry once it holds
 * `capacity` entries.
 */
template<typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class LRUStore : public Store<K, V>
{
    Sync<LRUCache<K, V, Hash, KeyEqual>> cache_;

public:

    LRUStore(size_t capacity)
        : cache_(LRUCache<K, V, Hash, KeyEqual>(capacity))
    {
    }

    std::optional<V> lookup(const K & key) override
    {
        return cache_.lock()->get(key);
    }

    void insert(const K & key, const V & value) override
    {
        cache_.lock()->upsert(key, value);
    }

    bool remove(const K & key) override
    {
        return cache_.lock()->erase(key);
    }

    size_t removeIf(fun<bool(const K &, const V &)> pred) override
    {
        return cache_.lock()->eraseIf(pred);
    }

    void clear() override
    {
        cache_.lock()->clear();
    }

    size_t size() override
    {
        return cache_.readLock()->size();
    }

    size_t capacity() override
    {
        return cache_.readLock()->capacity();
    }
};

} // namespace memo
