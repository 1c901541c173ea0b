#pragma once
///@file

#include "memo/cache/cache-settings.hh"
#include "memo/cache/computation.hh"
#include "memo/cache/inflight-registry.hh"
#include "memo/cache/outcome.hh"
#include "memo/cache/scheduler.hh"
#include "memo/cache/store.hh"
#include "memo/util/logging.hh"
#include "memo/util/ref.hh"
#include "memo/util/signals.hh"

#include <functional>
#include <memory>
#include <optional>

namespace memo {

/**
 * A thread-safe cache with compute-if-absent entry points.
 *
 * `getOrInsertWith()` and `getOrTryInsertWith()` return the value
 * stored under a key, computing it first if the key is absent. However
 * many threads ask for the same absent key at once, its computation
 * runs once: the first caller registers a pending entry and submits the
 * computation to the scheduler, the others attach to that entry, and
 * all of them receive the single published outcome.
 *
 * A computation may run on a scheduler thread after its caller has
 * stopped waiting, so it must own everything it uses
 * (`SelfContainedComputation`).
 *
 * `Cache` is a handle: copies share the store, the in-flight registry
 * and the scheduler.
 */
template<typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class Cache
{
    static_assert(Transferable<K>, "cache keys must be owning object types, not references, pointers or views");
    static_assert(Transferable<V>, "cache values must be owning object types, not references, pointers or views");
    static_assert(std::is_copy_constructible_v<V>, "every caller receives a copy of the cached value");

    struct Inner
    {
        ref<Store<K, V>> store;
        InFlightRegistry<K, V, Hash, KeyEqual> registry;

        Inner(ref<Store<K, V>> store)
            : store(std::move(store))
        {
        }

        /**
         * Commit `outcome` for `key`: the value, if any, is written to the
         * store, then the entry leaves the registry, then its waiters are
         * released.
         */
        void finish(const K & key, const ref<PendingEntry<V>> & entry, Outcome<V> outcome)
        {
            if (auto value = outcome.value()) {
                try {
                    store->insert(key, *value);
                } catch (...) {
                    outcome = Outcome<V>::aborted(fmt("cannot store the computed value: %s", describeCurrentException()));
                }
            }

            if (auto aborted = outcome.abortion())
                printError("cache computation aborted: %s", aborted->reason);

            registry.complete(key, entry, std::move(outcome));
        }
    };

    /**
     * The scheduled half of a computation. If the scheduler destroys it
     * without running it, the entry is aborted so that no caller waits
     * forever.
     */
    struct Task
    {
        ref<Inner> inner;
        K key;
        ref<PendingEntry<V>> entry;
        Computation<V> computation;
        FailurePolicy policy;
        bool done = false;

        Task(ref<Inner> inner, K key, ref<PendingEntry<V>> entry, Computation<V> computation, FailurePolicy policy)
            : inner(std::move(inner))
            , key(std::move(key))
            , entry(std::move(entry))
            , computation(std::move(computation))
            , policy(policy)
        {
        }

        Task(const Task &) = delete;

        ~Task()
        {
            if (!done)
                abort("the scheduler dropped the computation before running it");
        }

        void run()
        {
            done = true;
            vomit("running cache computation");
            inner->finish(key, entry, evaluate());
        }

        void abort(const std::string & reason)
        {
            done = true;
            try {
                inner->finish(key, entry, Outcome<V>::aborted(reason));
            } catch (...) {
                ignoreException();
            }
        }

        Outcome<V> evaluate()
        {
            try {
                checkInterrupt();
                return Outcome<V>::ok(computation());
            } catch (Interrupted &) {
                return Outcome<V>::aborted(describeCurrentException());
            } catch (ThreadPoolShutDown &) {
                return Outcome<V>::aborted(describeCurrentException());
            } catch (BaseError & e) {
                if (policy == FailurePolicy::Propagate) {
                    /* Every waiter is handed this very object. */
                    e.prepareForSharing();
                    return Outcome<V>::failed(std::current_exception());
                }
                return Outcome<V>::aborted(e.message());
            } catch (...) {
                if (policy == FailurePolicy::Propagate)
                    return Outcome<V>::failed(std::current_exception());
                return Outcome<V>::aborted(describeCurrentException());
            }
        }
    };

    ref<Inner> inner;
    ref<Scheduler> scheduler;

    void start(K key, const ref<PendingEntry<V>> & entry, Computation<V> computation, FailurePolicy policy)
    {
        auto task = std::make_shared<Task>(inner, std::move(key), entry, std::move(computation), policy);
        try {
            scheduler->schedule([task]() { task->run(); });
        } catch (ThreadPoolShutDown & e) {
            task->abort(e.message());
        }
    }

    V resolve(K key, Computation<V> computation, FailurePolicy policy)
    {
        if (auto value = inner->store->lookup(key))
            return std::move(*value);

        auto [won, entry] = inner->registry.tryBegin(key);

        auto subscription = entry->attach();

        if (won) {
            /* Another initiator may have committed this key between our
               lookup and tryBegin(). */
            if (auto value = inner->store->lookup(key))
                inner->registry.complete(key, entry, Outcome<V>::ok(std::move(*value)));
            else {
                debug("starting cache computation (%d pending)", inner->registry.size());
                start(std::move(key), entry, std::move(computation), policy);
            }
        }

        auto outcome = subscription.wait();
        return outcome->get();
    }

public:

    /**
     * A cache with the default `LRUStore` and a thread pool scheduler,
     * configured by `settings`.
     */
    explicit Cache(const CacheSettings & settings)
        : Cache(make_ref<LRUStore<K, V, Hash, KeyEqual>>(settings.maxCapacity.get()),
                make_ref<ThreadPoolScheduler>(settings.workerThreads.get()))
    {
    }

    /**
     * A cache with an `LRUStore` holding up to `maxCapacity` entries
     * and a thread pool scheduler with one thread per hardware thread.
     */
    explicit Cache(size_t maxCapacity)
        : Cache(make_ref<LRUStore<K, V, Hash, KeyEqual>>(maxCapacity), make_ref<ThreadPoolScheduler>())
    {
    }

    Cache(ref<Store<K, V>> store, ref<Scheduler> scheduler)
        : inner(make_ref<Inner>(std::move(store)))
        , scheduler(std::move(scheduler))
    {
    }

    /**
     * Return the value stored under `key`. If there is none, compute it
     * with `init`, store it and return it; concurrent calls for the
     * same key share one evaluation of one `init`, the others are
     * destroyed unused.
     *
     * `init` is infallible: if it throws anyway, nothing is stored and
     * every caller gets `ComputationAborted`.
     */
    template<typename F>
        requires SelfContainedComputation<F, V>
    V getOrInsertWith(K key, F && init)
    {
        return resolve(std::move(key), Computation<V>(std::forward<F>(init)), FailurePolicy::Abort);
    }

    /**
     * Like `getOrInsertWith()`, but `init` may fail by throwing. Its
     * exception is rethrown to every caller that waited on this
     * evaluation, and nothing is stored, so a later call starts a new
     * evaluation.
     *
     * All those callers catch the same exception object, possibly at
     * the same time, so they must treat it as read-only: to add
     * context (`addTrace()`), throw a new error instead.
     */
    template<typename F>
        requires SelfContainedComputation<F, V>
    V getOrTryInsertWith(K key, F && init)
    {
        return resolve(std::move(key), Computation<V>(std::forward<F>(init)), FailurePolicy::Propagate);
    }

    /**
     * Look up a committed value. Does not wait for a pending
     * computation of `key`.
     */
    std::optional<V> get(const K & key)
    {
        return inner->store->lookup(key);
    }

    void insert(K key, V value)
    {
        inner->store->insert(key, value);
    }

    void invalidate(const K & key)
    {
        inner->store->remove(key);
    }

    void invalidateAll()
    {
        inner->store->clear();
    }

    /**
     * Remove every committed entry for which `pred` holds.
     *
     * @returns the number of entries removed.
     */
    size_t invalidateEntriesIf(fun<bool(const K &, const V &)> pred)
    {
        return inner->store->removeIf(std::move(pred));
    }

    size_t maxCapacity()
    {
        return inner->store->capacity();
    }

    /**
     * A plain cache is a single segment.
     *
     * @see SegmentedCache::segmentCount()
     */
    size_t segmentCount() const
    {
        return 1;
    }

    size_t entryCount()
    {
        return inner->store->size();
    }

    /**
     * The number of keys with a computation in flight.
     */
    size_t pendingCount()
    {
        return inner->registry.size();
    }

    /**
     * The number of callers, initiator included, waiting for the
     * computation of `key`. 0 if no computation of `key` is in flight.
     */
    size_t waiterCount(const K & key)
    {
        auto entry = inner->registry.find(key);
        return entry ? entry->waiterCount() : 0;
    }
};

} // namespace memo
