#include "memo/cache/cache.hh"
#include "memo/cache/computation.hh"

#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace memo {

namespace {

template<typename C, typename K, typename F>
concept CanGetOrInsertWith = requires(C & cache, K key, F && f) {
    cache.getOrInsertWith(std::move(key), std::forward<F>(f));
};

template<typename C, typename K, typename F>
concept CanGetOrTryInsertWith = requires(C & cache, K key, F && f) {
    cache.getOrTryInsertWith(std::move(key), std::forward<F>(f));
};

template<typename F, typename... Args>
concept CanMakeComputation = requires(F && f, Args &&... args) {
    makeComputation(std::forward<F>(f), std::forward<Args>(args)...);
};

struct Widget
{
    int answer()
    {
        return 42;
    }
};

struct Immovable
{
    Immovable() = default;
    Immovable(Immovable &&) = delete;

    int operator()()
    {
        return 1;
    }
};

int freeFunction()
{
    return 7;
}

int add(int a, int b)
{
    return a + b;
}

size_t length(const std::string & s)
{
    return s.size();
}

auto owningLambda = [s = std::string("owned")]() { return s; };
using OwningLambda = decltype(owningLambda);

} // namespace

/* ----------------------------------------------------------------------------
 * Transferable
 * --------------------------------------------------------------------------*/

static_assert(Transferable<int>);
static_assert(Transferable<std::string>);
static_assert(Transferable<std::vector<int>>);
static_assert(Transferable<std::shared_ptr<const std::string>>);

static_assert(!Transferable<int &>);
static_assert(!Transferable<const std::string &>);
static_assert(!Transferable<int *>);
static_assert(!Transferable<const char *>);
static_assert(!Transferable<int (*)()>);
static_assert(!Transferable<std::string_view>);
static_assert(!Transferable<std::span<int>>);
static_assert(!Transferable<std::reference_wrapper<int>>);

/* ----------------------------------------------------------------------------
 * SelfContainedComputation
 * --------------------------------------------------------------------------*/

static_assert(SelfContainedComputation<OwningLambda, std::string>);
static_assert(SelfContainedComputation<int (*)(), int>);
static_assert(SelfContainedComputation<std::function<int()>, long>);

// Named objects must be handed over, not lent.
static_assert(!SelfContainedComputation<OwningLambda &, std::string>);
static_assert(!SelfContainedComputation<const OwningLambda &, std::string>);
static_assert(!SelfContainedComputation<int (&)(), int>);

static_assert(!SelfContainedComputation<std::reference_wrapper<OwningLambda>, std::string>);
static_assert(!SelfContainedComputation<OwningLambda *, std::string>);
static_assert(!SelfContainedComputation<int (Widget::*)(), int>);
static_assert(!SelfContainedComputation<Immovable, int>);

// The result has to be a V.
static_assert(!SelfContainedComputation<OwningLambda, int>);

static_assert(CanGetOrInsertWith<Cache<int, std::string>, int, OwningLambda>);
static_assert(!CanGetOrInsertWith<Cache<int, std::string>, int, OwningLambda &>);
static_assert(!CanGetOrInsertWith<Cache<int, std::string>, int, std::reference_wrapper<OwningLambda>>);
static_assert(CanGetOrTryInsertWith<Cache<int, std::string>, int, OwningLambda>);
static_assert(!CanGetOrTryInsertWith<Cache<int, std::string>, int, const OwningLambda &>);
static_assert(CanGetOrInsertWith<Cache<int, std::string>, int, Computation<std::string>>);

/* ----------------------------------------------------------------------------
 * makeComputation
 * --------------------------------------------------------------------------*/

static_assert(CanMakeComputation<int (*)(int, int), int, int>);
static_assert(CanMakeComputation<size_t (*)(const std::string &), std::string>);
static_assert(!CanMakeComputation<size_t (*)(const std::string &), std::reference_wrapper<std::string>>);
static_assert(!CanMakeComputation<size_t (*)(const std::string &), const char *>);
static_assert(!CanMakeComputation<size_t (*)(std::string_view), std::string_view>);
static_assert(!CanMakeComputation<OwningLambda *>);

TEST(makeComputation, copiesItsArguments)
{
    std::string s = "four";
    auto c = makeComputation(length, s);
    s = "much longer now";
    ASSERT_EQ(c(), 4u);
}

TEST(makeComputation, movesOwnedArguments)
{
    auto data = std::make_unique<int>(20);
    auto c = makeComputation([](std::unique_ptr<int> p, int extra) { return *p + extra; }, std::move(data), 22);
    ASSERT_FALSE(data);
    ASSERT_EQ(c(), 42);
}

TEST(makeComputation, acceptsFreeFunctions)
{
    ASSERT_EQ(makeComputation(add, 40, 2)(), 42);
    ASSERT_EQ(makeComputation(freeFunction)(), 7);
}

/* ----------------------------------------------------------------------------
 * Computation
 * --------------------------------------------------------------------------*/

TEST(Computation, runsOnce)
{
    auto counter = std::make_shared<int>(0);
    Computation<int> c([counter]() { return ++*counter; });
    ASSERT_TRUE((bool) c);
    ASSERT_EQ(c(), 1);
    ASSERT_FALSE((bool) c);
    ASSERT_THROW(c(), Error);
    ASSERT_EQ(*counter, 1);
}

TEST(Computation, destroysCallableAfterRunning)
{
    auto resource = std::make_shared<int>(1);
    Computation<int> c([resource]() { return *resource; });
    ASSERT_EQ(resource.use_count(), 2);
    ASSERT_EQ(c(), 1);
    ASSERT_EQ(resource.use_count(), 1);
}

TEST(Computation, convertsResult)
{
    Computation<std::string> c([]() { return "literal"; });
    ASSERT_EQ(c(), "literal");
}

TEST(Computation, isMovable)
{
    Computation<int> a(&freeFunction);
    Computation<int> b(std::move(a));
    ASSERT_FALSE((bool) a);
    ASSERT_EQ(b(), 7);
}

} // namespace memo
