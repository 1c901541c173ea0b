#pragma once
///@file

#include "memo/util/fun.hh"
#include "memo/util/thread-pool.hh"

namespace memo {

/**
 * Runs self-contained work items to completion, possibly on another
 * thread.
 */
struct Scheduler
{
    typedef fun<void()> Work;

    virtual ~Scheduler() = default;

    /**
     * Submit `work`. A scheduler that destroys an accepted item without
     * running it must only do so when it is shutting down.
     *
     * @throws ThreadPoolShutDown if no more work is accepted.
     */
    virtual void schedule(Work work) = 0;
};

/**
 * Runs work items on the persistent workers of a `ThreadPool`. An
 * item scheduled by one of those workers runs on that worker before
 * `schedule()` returns, so computations may use the cache themselves
 * without exhausting the pool.
 */
class ThreadPoolScheduler : public Scheduler
{
    ThreadPool pool;

public:

    /**
     * @param maxThreads the maximum number of worker threads, 0 for
     * one per hardware thread.
     */
    ThreadPoolScheduler(size_t maxThreads = 0);

    void schedule(Work work) override;

    /**
     * Stop accepting work and drop the items that have not started.
     */
    void shutdown();

    /**
     * Block until every accepted item has run.
     */
    void drain();

    size_t workerCount();
};

/**
 * Runs every work item on the thread that submits it, before
 * `schedule()` returns.
 */
struct InlineScheduler : Scheduler
{
    void schedule(Work work) override;
};

} // namespace memo
