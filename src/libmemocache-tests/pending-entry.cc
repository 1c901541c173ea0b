#include "memo/cache/inflight-registry.hh"
#include "memo/cache/pending-entry.hh"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace memo {

using namespace std::chrono_literals;

/* ----------------------------------------------------------------------------
 * Outcome
 * --------------------------------------------------------------------------*/

TEST(Outcome, okReturnsValue)
{
    auto o = Outcome<int>::ok(5);
    ASSERT_TRUE(o.isOk());
    ASSERT_EQ(o.get(), 5);
    ASSERT_EQ(o.failure(), nullptr);
}

TEST(Outcome, failedRethrowsTheSameException)
{
    std::exception_ptr thrown;
    try {
        throw UsageError("bad input");
    } catch (...) {
        thrown = std::current_exception();
    }

    auto o = Outcome<int>::failed(thrown);
    ASSERT_FALSE(o.isOk());

    const UsageError * first = nullptr;
    try {
        o.get();
    } catch (UsageError & e) {
        first = &e;
    }
    try {
        o.get();
    } catch (UsageError & e) {
        ASSERT_EQ(&e, first);
        ASSERT_EQ(e.message(), "bad input");
    }
}

TEST(Outcome, abortedThrowsComputationAborted)
{
    auto o = Outcome<int>::aborted("scheduler went away");
    try {
        o.get();
        FAIL() << "expected ComputationAborted";
    } catch (ComputationAborted & e) {
        ASSERT_EQ(e.message(), "computation aborted: scheduler went away");
    }
}

/* ----------------------------------------------------------------------------
 * PendingEntry
 * --------------------------------------------------------------------------*/

TEST(PendingEntry, waitersReceiveTheSameOutcome)
{
    PendingEntry<std::string> entry;
    auto a = entry.attach();
    auto b = entry.attach();
    ASSERT_FALSE(a.isResolved());
    ASSERT_EQ(entry.waiterCount(), 2u);

    auto published = entry.publish(Outcome<std::string>::ok("x"));

    ASSERT_TRUE(entry.isCompleted());
    ASSERT_EQ(a.wait(), published);
    ASSERT_EQ(b.wait(), published);
    ASSERT_EQ(a.wait()->get(), "x");
}

TEST(PendingEntry, lateAttachIsResolved)
{
    PendingEntry<int> entry;
    entry.publish(Outcome<int>::ok(3));

    auto late = entry.attach();
    ASSERT_TRUE(late.isResolved());
    ASSERT_EQ(late.wait()->get(), 3);
    ASSERT_EQ(entry.waiterCount(), 0u);
}

TEST(PendingEntry, publishTwiceThrows)
{
    PendingEntry<int> entry;
    entry.publish(Outcome<int>::ok(1));
    ASSERT_THROW(entry.publish(Outcome<int>::ok(2)), Error);

    ASSERT_EQ(entry.attach().wait()->get(), 1);
}

TEST(PendingEntry, waitForTimesOut)
{
    PendingEntry<int> entry;
    auto s = entry.attach();
    ASSERT_EQ(s.waitFor(10ms), nullptr);

    entry.publish(Outcome<int>::ok(4));
    auto o = s.waitFor(10ms);
    ASSERT_NE(o, nullptr);
    ASSERT_EQ(o->get(), 4);
}

TEST(PendingEntry, abandonedSubscriptionsAreSkipped)
{
    PendingEntry<int> entry;
    auto kept = entry.attach();
    {
        auto dropped = entry.attach();
        ASSERT_EQ(entry.waiterCount(), 2u);
    }
    ASSERT_EQ(entry.waiterCount(), 1u);

    entry.publish(Outcome<int>::ok(9));
    ASSERT_EQ(kept.wait()->get(), 9);
}

TEST(PendingEntry, publishWakesBlockedThreads)
{
    PendingEntry<int> entry;
    std::atomic<int> sum{0};
    std::vector<std::thread> threads;
    std::vector<Subscription<int>> subscriptions;

    for (int i = 0; i < 8; ++i)
        subscriptions.push_back(entry.attach());

    for (auto & s : subscriptions)
        threads.emplace_back([&sum, &s] { sum += s.wait()->get(); });

    entry.publish(Outcome<int>::ok(5));

    for (auto & t : threads)
        t.join();

    ASSERT_EQ(sum.load(), 40);
}

/* ----------------------------------------------------------------------------
 * InFlightRegistry
 * --------------------------------------------------------------------------*/

TEST(InFlightRegistry, firstCallerWins)
{
    InFlightRegistry<std::string, int> registry;

    auto first = registry.tryBegin("k");
    auto second = registry.tryBegin("k");

    ASSERT_TRUE(first.won);
    ASSERT_FALSE(second.won);
    ASSERT_EQ(first.entry, second.entry);
    ASSERT_EQ(registry.size(), 1u);

    ASSERT_TRUE(registry.tryBegin("other").won);
    ASSERT_EQ(registry.size(), 2u);
}

TEST(InFlightRegistry, completeRemovesThenPublishes)
{
    InFlightRegistry<std::string, int> registry;
    auto begin = registry.tryBegin("k");
    auto s = begin.entry->attach();

    registry.complete("k", begin.entry, Outcome<int>::ok(7));

    ASSERT_EQ(registry.size(), 0u);
    ASSERT_EQ(registry.find("k"), nullptr);
    ASSERT_EQ(s.wait()->get(), 7);

    // The key is free for a new computation.
    ASSERT_TRUE(registry.tryBegin("k").won);
}

TEST(InFlightRegistry, completeLeavesNewerEntryAlone)
{
    InFlightRegistry<int, int> registry;
    auto old = registry.tryBegin(1);
    registry.complete(1, old.entry, Outcome<int>::aborted("gone"));

    auto newer = registry.tryBegin(1);
    ASSERT_TRUE(newer.won);

    ASSERT_THROW(registry.complete(1, old.entry, Outcome<int>::ok(1)), Error);
    ASSERT_EQ(registry.size(), 1u);
    ASSERT_EQ(registry.find(1), newer.entry.get_ptr());
}

TEST(InFlightRegistry, concurrentTryBeginHasOneWinner)
{
    InFlightRegistry<int, int> registry;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 16; ++i)
        threads.emplace_back([&] {
            if (registry.tryBegin(42).won)
                winners++;
        });
    for (auto & t : threads)
        t.join();

    ASSERT_EQ(winners.load(), 1);
    ASSERT_EQ(registry.size(), 1u);
}

} // namespace memo
