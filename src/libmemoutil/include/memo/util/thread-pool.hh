#pragma once
///@file

#include "memo/util/error.hh"
#include "memo/util/ref.hh"
#include "memo/util/sync.hh"

#include <atomic>
#include <functional>
#include <queue>
#include <thread>
#include <vector>

namespace memo {

MakeError(ThreadPoolShutDown, Error);

/**
 * A thread pool that executes a queue of work items (lambdas) on
 * persistent worker threads. Workers are started on demand, when more
 * items are pending than there are idle workers, up to `maxThreads`.
 *
 * The pool keeps running until it is shut down (explicitly or by its
 * destructor), so it can serve as a long-lived executor.
 */
class ThreadPool
{
public:

    ThreadPool(size_t maxThreads = 0);

    ~ThreadPool();

    /**
     * An individual work item.
     */
    typedef std::function<void()> work_t;

    /**
     * Enqueue a function to be executed by the thread pool.
     *
     * @throws ThreadPoolShutDown if the pool has been shut down.
     */
    void enqueue(work_t t);

    /**
     * Block until no work item is pending or running. Work items may
     * enqueue further items; those are waited for too.
     *
     * If a work item threw an exception since the previous call, the
     * first such exception is rethrown here; later ones are logged and
     * otherwise ignored.
     *
     * \note Must not be called from a work item.
     */
    void process();

    /**
     * Stop accepting work, discard pending items without running them
     * and join the workers. Items that are already running finish
     * first. Idempotent.
     */
    void shutdown();

    /**
     * Whether the calling thread is one of this pool's workers.
     */
    bool onWorkerThread() const;

    /**
     * The number of worker threads started so far.
     */
    size_t workerCount();

private:

    size_t maxThreads;

    struct State
    {
        std::queue<work_t> pending;
        size_t active = 0;
        size_t idle = 0;
        std::exception_ptr exception;
        std::vector<std::thread> workers;
    };

    /* Shared with the workers, so that a worker that ends up
       destroying the pool (by dropping the last reference to its
       owner) can still finish its loop. */
    struct Shared
    {
        Sync<State> state_;
        std::condition_variable work;
        std::condition_variable done;
        std::atomic_bool quit{false};
    };

    ref<Shared> shared;

    /* The pool whose work item the current thread is running. */
    static thread_local const Shared * currentPool;

    static void doWork(ref<Shared> shared);
};

} // namespace memo
