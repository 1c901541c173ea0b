#pragma once
///@file

#include "memo/cache/pending-entry.hh"
#include "memo/util/ref.hh"
#include "memo/util/sync.hh"

#include <functional>
#include <unordered_map>

namespace memo {

/**
 * The set of keys whose value is being computed right now, each
 * mapped to its pending entry. There is never more than one entry per
 * key: lookup and insertion happen under one lock.
 */
template<typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class InFlightRegistry
{
    Sync<std::unordered_map<K, ref<PendingEntry<V>>, Hash, KeyEqual>> entries_;

public:

    struct Begin
    {
        /**
         * Whether the caller registered a new entry and is therefore
         * responsible for starting the computation.
         */
        bool won;
        ref<PendingEntry<V>> entry;
    };

    /**
     * Return the entry for `key`, creating it if there is none.
     */
    Begin tryBegin(const K & key)
    {
        auto entries(entries_.lock());
        auto i = entries->find(key);
        if (i != entries->end())
            return {false, i->second};
        auto entry = make_ref<PendingEntry<V>>();
        entries->emplace(key, entry);
        return {true, entry};
    }

    /**
     * Remove `entry` from the registry (unless `key` has been taken
     * over by another entry in the meantime), then publish `outcome`
     * to it. Callers that attach after this observe the outcome
     * directly.
     */
    std::shared_ptr<const Outcome<V>> complete(const K & key, const ref<PendingEntry<V>> & entry, Outcome<V> outcome)
    {
        {
            auto entries(entries_.lock());
            auto i = entries->find(key);
            if (i != entries->end() && i->second == entry)
                entries->erase(i);
        }
        return entry->publish(std::move(outcome));
    }

    std::shared_ptr<PendingEntry<V>> find(const K & key)
    {
        auto entries(entries_.lock());
        auto i = entries->find(key);
        if (i == entries->end())
            return nullptr;
        return i->second;
    }

    size_t size()
    {
        return entries_.lock()->size();
    }
};

} // namespace memo
