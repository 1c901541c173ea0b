#pragma once
///@file

#include "memo/cache/scheduler.hh"
#include "memo/util/sync.hh"

#include <condition_variable>
#include <deque>
#include <optional>

namespace memo::testing {

/**
 * A scheduler that only queues work. The test decides when each item
 * runs, on which thread, or whether it is dropped.
 */
class ManualScheduler : public Scheduler
{
    struct State
    {
        std::deque<Work> queue;
        bool refusing = false;
    };

    Sync<State> state_;
    std::condition_variable wakeup;

public:

    void schedule(Work work) override
    {
        {
            auto state(state_.lock());
            if (state->refusing)
                throw ThreadPoolShutDown("scheduler is refusing work");
            state->queue.push_back(std::move(work));
        }
        wakeup.notify_all();
    }

    /**
     * Make every following `schedule()` throw `ThreadPoolShutDown`.
     */
    void refuse()
    {
        state_.lock()->refusing = true;
    }

    size_t queued()
    {
        return state_.lock()->queue.size();
    }

    /**
     * Wait until at least `n` items are queued.
     */
    void waitForQueued(size_t n)
    {
        auto state(state_.lock());
        state.wait(wakeup, [&]() { return state->queue.size() >= n; });
    }

    std::optional<Work> take()
    {
        auto state(state_.lock());
        if (state->queue.empty())
            return std::nullopt;
        auto work = std::move(state->queue.front());
        state->queue.pop_front();
        return work;
    }

    /**
     * Run the oldest queued item on the calling thread.
     */
    bool runOne()
    {
        auto work = take();
        if (!work)
            return false;
        (*work)();
        return true;
    }

    /**
     * Destroy every queued item without running it.
     */
    void dropAll()
    {
        std::deque<Work> dropped;
        std::swap(dropped, state_.lock()->queue);
    }
};

} // namespace memo::testing
