#include "memo/cache/scheduler.hh"

namespace memo {

ThreadPoolScheduler::ThreadPoolScheduler(size_t maxThreads)
    : pool(maxThreads)
{
}

void ThreadPoolScheduler::schedule(Work work)
{
    /* Work submitted from a work item (a computation that asks the
       cache for another key) would otherwise wait for a worker while
       occupying one. */
    if (pool.onWorkerThread())
        work();
    else
        pool.enqueue(std::move(work).get_fn());
}

void ThreadPoolScheduler::shutdown()
{
    pool.shutdown();
}

void ThreadPoolScheduler::drain()
{
    pool.process();
}

size_t ThreadPoolScheduler::workerCount()
{
    return pool.workerCount();
}

void InlineScheduler::schedule(Work work)
{
    work();
}

} // namespace memo
