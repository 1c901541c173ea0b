#include "memo/util/thread-pool.hh"
#include "memo/util/finally.hh"
#include "memo/util/logging.hh"
#include "memo/util/signals.hh"

namespace memo {

thread_local const ThreadPool::Shared * ThreadPool::currentPool = nullptr;

ThreadPool::ThreadPool(size_t _maxThreads)
    : maxThreads(_maxThreads)
    , shared(make_ref<Shared>())
{
    if (!maxThreads) {
        maxThreads = std::thread::hardware_concurrency();
        if (!maxThreads)
            maxThreads = 1;
    }

    debug("starting pool of up to %d threads", maxThreads);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    std::vector<std::thread> workers;
    std::queue<work_t> dropped;
    {
        auto state(shared->state_.lock());
        shared->quit = true;
        std::swap(workers, state->workers);
        std::swap(dropped, state->pending);
    }

    shared->work.notify_all();
    shared->done.notify_all();

    if (!dropped.empty()) {
        debug("discarding %d pending work items", dropped.size());
        dropped = {};
    }

    if (workers.empty())
        return;

    debug("reaping %d worker threads", workers.size());

    for (auto & thr : workers) {
        /* The last owner of the pool may be released by one of its
           own work items. */
        if (thr.get_id() == std::this_thread::get_id())
            thr.detach();
        else
            thr.join();
    }
}

void ThreadPool::enqueue(work_t t)
{
    auto state(shared->state_.lock());
    if (shared->quit)
        throw ThreadPoolShutDown("cannot enqueue a work item while the thread pool is shutting down");
    state->pending.push(std::move(t));
    if (state->pending.size() > state->idle && state->workers.size() < maxThreads)
        state->workers.emplace_back(&ThreadPool::doWork, shared);
    shared->work.notify_one();
}

void ThreadPool::process()
{
    std::exception_ptr exc;
    {
        auto state(shared->state_.lock());
        state.wait(shared->done, [&]() { return shared->quit || (!state->active && state->pending.empty()); });
        std::swap(exc, state->exception);
    }
    if (exc)
        std::rethrow_exception(exc);
}

bool ThreadPool::onWorkerThread() const
{
    return currentPool == &*shared;
}

size_t ThreadPool::workerCount()
{
    return shared->state_.lock()->workers.size();
}

void ThreadPool::doWork(ref<Shared> shared)
{
    interruptCheck = [&]() { return (bool) shared->quit; };
    currentPool = &*shared;
    Finally resetThreadState([]() {
        interruptCheck = nullptr;
        currentPool = nullptr;
    });

    while (true) {
        work_t w;
        {
            auto state(shared->state_.lock());

            state->idle++;
            state.wait(shared->work, [&]() { return shared->quit || !state->pending.empty(); });
            state->idle--;

            if (shared->quit)
                return;

            w = std::move(state->pending.front());
            state->pending.pop();
            state->active++;
        }

        std::exception_ptr exc;

        try {
            w();
        } catch (...) {
            exc = std::current_exception();
        }

        /* Release whatever the item captured before taking the lock
           again. */
        w = nullptr;

        bool report = false;
        {
            auto state(shared->state_.lock());
            assert(state->active);
            state->active--;
            if (exc) {
                if (!state->exception)
                    state->exception = exc;
                else
                    report = true;
            }
            if (!state->active && state->pending.empty())
                shared->done.notify_all();
        }

        if (report) {
            /* Print the exception, since we can't propagate it. */
            try {
                std::rethrow_exception(exc);
            } catch (Interrupted &) {
            } catch (ThreadPoolShutDown &) {
            } catch (...) {
                ignoreException();
            }
        }
    }
}

} // namespace memo
