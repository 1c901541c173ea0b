#pragma once
///@file

#include "memo/util/error.hh"

#include <atomic>
#include <functional>

namespace memo {

/**
 * Thrown by `checkInterrupt()`. Not an `Error`, so that handlers for
 * ordinary failures do not catch it by accident.
 */
MakeError(Interrupted, BaseError);

extern std::atomic<bool> _isInterrupted;

/**
 * Per-thread extra condition for `isInterrupted()`. Thread pool
 * workers set it to observe pool shutdown.
 */
extern thread_local std::function<bool()> interruptCheck;

/**
 * Sets the process-wide interrupted flag.
 */
void setInterrupted(bool isInterrupted);

static inline bool getInterrupted()
{
    return _isInterrupted;
}

/**
 * @note Does not throw `Interrupted`.
 */
static inline bool isInterrupted()
{
    return _isInterrupted || (interruptCheck && interruptCheck());
}

/**
 * Throw `Interrupted` if the process has been interrupted or, on a
 * worker thread, the owning pool is shutting down.
 */
void checkInterrupt();

} // namespace memo
