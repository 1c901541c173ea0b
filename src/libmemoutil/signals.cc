#include "memo/util/signals.hh"

namespace memo {

std::atomic<bool> _isInterrupted = false;

thread_local std::function<bool()> interruptCheck;

void setInterrupted(bool isInterrupted)
{
    _isInterrupted = isInterrupted;
}

void checkInterrupt()
{
    /* Throwing while another exception is being handled would kill
       the program. */
    if (isInterrupted() && !std::uncaught_exceptions())
        throw Interrupted("interrupted");
}

} // namespace memo
