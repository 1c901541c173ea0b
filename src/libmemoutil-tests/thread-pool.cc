#include "memo/util/signals.hh"
#include "memo/util/thread-pool.hh"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <thread>

namespace memo {

TEST(threadpool, correctValue)
{
    ThreadPool pool(3);
    int sum = 0;
    std::mutex mtx;
    for (int i = 0; i < 20; i++) {
        pool.enqueue([&] {
            std::lock_guard<std::mutex> lock(mtx);
            sum += 1;
        });
    }
    pool.process();
    ASSERT_EQ(sum, 20);
}

TEST(threadpool, properlyHandlesDirectExceptions)
{
    struct TestExn
    {};

    ThreadPool pool(3);
    pool.enqueue([&] { throw TestExn(); });
    EXPECT_THROW(pool.process(), TestExn);
}

TEST(threadpool, keepsRunningAfterProcess)
{
    ThreadPool pool(2);
    std::atomic<int> n{0};

    pool.enqueue([&] { n++; });
    pool.process();
    ASSERT_EQ(n.load(), 1);

    pool.enqueue([&] { n++; });
    pool.process();
    ASSERT_EQ(n.load(), 2);
}

TEST(threadpool, workItemsMayEnqueueMore)
{
    ThreadPool pool(2);
    std::atomic<int> n{0};

    pool.enqueue([&] {
        n++;
        pool.enqueue([&] { n++; });
    });
    pool.process();
    ASSERT_EQ(n.load(), 2);
}

TEST(threadpool, neverStartsMoreThanMaxThreads)
{
    ThreadPool pool(2);
    std::promise<void> release;
    auto released = release.get_future().share();

    for (int i = 0; i < 5; i++)
        pool.enqueue([released] { released.wait(); });

    ASSERT_LE(pool.workerCount(), 2u);
    release.set_value();
    pool.process();
    ASSERT_LE(pool.workerCount(), 2u);
}

TEST(threadpool, enqueueAfterShutdownThrows)
{
    ThreadPool pool(1);
    pool.shutdown();
    ASSERT_THROW(pool.enqueue([] {}), ThreadPoolShutDown);
}

TEST(threadpool, shutdownDropsPendingItems)
{
    ThreadPool pool(1);
    std::promise<void> started, release;
    auto released = release.get_future().share();
    bool ranSecond = false;

    auto destroyed = std::make_shared<int>(0);

    pool.enqueue([&started, released] {
        started.set_value();
        released.wait();
    });
    pool.enqueue([&ranSecond, destroyed] { ranSecond = true; });

    started.get_future().wait();
    ASSERT_EQ(destroyed.use_count(), 2);

    std::thread stopper([&] { pool.shutdown(); });

    /* The pending item is discarded before the running one finishes. */
    while (destroyed.use_count() != 1)
        std::this_thread::yield();
    release.set_value();
    stopper.join();

    ASSERT_FALSE(ranSecond);
}

TEST(threadpool, shutdownInterruptsRunningItems)
{
    ThreadPool pool(1);
    std::promise<void> started;
    std::atomic<bool> interrupted{false};

    pool.enqueue([&] {
        started.set_value();
        try {
            while (true) {
                checkInterrupt();
                std::this_thread::yield();
            }
        } catch (Interrupted &) {
            interrupted = true;
        }
    });

    started.get_future().wait();
    pool.shutdown();
    ASSERT_TRUE(interrupted);
}

TEST(threadpool, knowsItsOwnWorkers)
{
    ThreadPool pool(1);
    ThreadPool other(1);
    ASSERT_FALSE(pool.onWorkerThread());

    std::atomic<bool> onOwn{false}, onOther{true};
    pool.enqueue([&] {
        onOwn = pool.onWorkerThread();
        onOther = other.onWorkerThread();
    });
    pool.process();

    ASSERT_TRUE(onOwn.load());
    ASSERT_FALSE(onOther.load());
    ASSERT_FALSE(pool.onWorkerThread());
}

} // namespace memo
