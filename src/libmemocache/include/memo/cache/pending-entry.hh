#pragma once
///@file

#include "memo/cache/outcome.hh"
#include "memo/util/error.hh"
#include "memo/util/sync.hh"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <vector>

namespace memo {

template<typename V>
class PendingEntry;

/**
 * One caller's claim on the outcome of a pending entry. The entry
 * only holds a weak reference to it, so dropping a subscription
 * abandons the wait without affecting the computation or the other
 * callers.
 */
template<typename V>
class Subscription
{
    friend class PendingEntry<V>;

    struct Channel
    {
        Sync<std::shared_ptr<const Outcome<V>>> result_;
        std::condition_variable wakeup;

        void resolve(const std::shared_ptr<const Outcome<V>> & outcome)
        {
            {
                auto result(result_.lock());
                *result = outcome;
            }
            wakeup.notify_all();
        }
    };

    std::shared_ptr<Channel> channel;

    explicit Subscription(std::shared_ptr<Channel> channel)
        : channel(std::move(channel))
    {
    }

public:

    Subscription(Subscription &&) = default;
    Subscription & operator=(Subscription &&) = default;

    /**
     * Block until the outcome has been published.
     */
    std::shared_ptr<const Outcome<V>> wait()
    {
        auto result(channel->result_.lock());
        result.wait(channel->wakeup, [&]() { return (bool) *result; });
        return *result;
    }

    /**
     * Like `wait()`, but give up after `timeout`.
     *
     * @returns the outcome, or nullptr if it was not published in time.
     */
    template<class Rep, class Period>
    std::shared_ptr<const Outcome<V>> waitFor(const std::chrono::duration<Rep, Period> & timeout)
    {
        auto result(channel->result_.lock());
        if (!result.wait_for(channel->wakeup, timeout, [&]() { return (bool) *result; }))
            return nullptr;
        return *result;
    }

    bool isResolved()
    {
        return (bool) *channel->result_.lock();
    }
};

/**
 * The computation handle for one key: either running, or completed
 * with an outcome. Any number of callers may attach to it; each of
 * them receives the single published outcome.
 */
template<typename V>
class PendingEntry
{
    using Channel = typename Subscription<V>::Channel;

    struct State
    {
        std::shared_ptr<const Outcome<V>> outcome;
        std::vector<std::weak_ptr<Channel>> waiters;
    };

    Sync<State> state_;

public:

    /**
     * Register interest in the outcome. If the outcome has already been
     * published, the returned subscription is resolved.
     */
    Subscription<V> attach()
    {
        auto channel = std::make_shared<Channel>();
        auto state(state_.lock());
        if (state->outcome)
            *channel->result_.lock() = state->outcome;
        else {
            std::erase_if(state->waiters, [](const std::weak_ptr<Channel> & w) { return w.expired(); });
            state->waiters.push_back(channel);
        }
        return Subscription<V>(std::move(channel));
    }

    /**
     * Make `outcome` the terminal state and release every attached
     * caller that is still waiting. The set of waiters is frozen
     * before anyone is released.
     *
     * @throws Error if an outcome was already published.
     */
    std::shared_ptr<const Outcome<V>> publish(Outcome<V> outcome)
    {
        auto published = std::make_shared<const Outcome<V>>(std::move(outcome));

        std::vector<std::weak_ptr<Channel>> waiters;
        {
            auto state(state_.lock());
            if (state->outcome)
                throw Error("pending entry was published twice");
            state->outcome = published;
            std::swap(waiters, state->waiters);
        }

        for (auto & w : waiters)
            if (auto channel = w.lock())
                channel->resolve(published);

        return published;
    }

    bool isCompleted()
    {
        return (bool) state_.lock()->outcome;
    }

    /**
     * The number of subscriptions that are still waiting.
     */
    size_t waiterCount()
    {
        auto state(state_.lock());
        return std::count_if(state->waiters.begin(), state->waiters.end(), [](const std::weak_ptr<Channel> & w) {
            return !w.expired();
        });
    }
};

} // namespace memo
