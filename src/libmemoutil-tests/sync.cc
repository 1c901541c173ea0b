#include "memo/util/finally.hh"
#include "memo/util/fun.hh"
#include "memo/util/ref.hh"
#include "memo/util/sync.hh"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace memo {

TEST(Sync, lockGivesAccess)
{
    Sync<int> n(0);
    *n.lock() = 41;
    (*n.lock())++;
    ASSERT_EQ(*n.readLock(), 42);
}

TEST(Sync, waitWithPredicateSeesUpdate)
{
    Sync<bool> ready(false);
    std::condition_variable cv;

    std::thread setter([&] {
        *ready.lock() = true;
        cv.notify_all();
    });

    {
        auto r(ready.lock());
        r.wait(cv, [&] { return *r; });
        ASSERT_TRUE(*r);
    }

    setter.join();
}

TEST(Sync, waitForTimesOut)
{
    Sync<bool> ready(false);
    std::condition_variable cv;
    auto r(ready.lock());
    ASSERT_FALSE(r.wait_for(cv, std::chrono::milliseconds(10), [&] { return *r; }));
}

TEST(Finally, runsAtEndOfScope)
{
    int n = 0;
    {
        Finally f([&] { n++; });
        ASSERT_EQ(n, 0);
    }
    ASSERT_EQ(n, 1);
}

TEST(ref, rejectsNull)
{
    ASSERT_THROW(ref<int>(std::shared_ptr<int>()), std::invalid_argument);
    auto r = make_ref<int>(5);
    ASSERT_EQ(*r, 5);
    std::shared_ptr<int> p = r;
    ASSERT_EQ(p.get(), &*r);
}

TEST(fun, rejectsEmptyFunction)
{
    ASSERT_THROW(fun<void()>(std::function<void()>()), std::invalid_argument);
    fun<int(int)> twice = [](int x) { return 2 * x; };
    ASSERT_EQ(twice(21), 42);
}

} // namespace memo
