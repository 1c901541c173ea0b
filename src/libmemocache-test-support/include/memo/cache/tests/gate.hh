#pragma once
///@file

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>

namespace memo::testing {

/**
 * A one-shot signal between threads. Copies share the same state, so
 * a gate can be captured by value in a computation.
 */
class Gate
{
    std::shared_ptr<std::promise<void>> promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> future = promise->get_future().share();

public:

    void open() const
    {
        promise->set_value();
    }

    void wait() const
    {
        future.wait();
    }

    bool isOpen() const
    {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

/**
 * Poll `pred` until it holds or `timeout` expires.
 *
 * @returns whether `pred` held.
 */
inline bool eventually(std::function<bool()> pred, std::chrono::milliseconds timeout = std::chrono::seconds(10))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace memo::testing
