#pragma once
///@file

#include "memo/util/error.hh"

#include <exception>
#include <string>
#include <variant>

namespace memo {

/**
 * Thrown to every caller attached to a computation that terminated
 * abnormally: it was interrupted, the scheduler refused or dropped it,
 * or an infallible computation threw anyway.
 */
MakeError(ComputationAborted, Error);

/**
 * How a pending entry treats an exception thrown by its computation.
 */
enum struct FailurePolicy {
    /**
     * The computation is infallible; an exception aborts it.
     */
    Abort,

    /**
     * The computation is fallible; its exception is handed to every
     * caller as is.
     */
    Propagate,
};

/**
 * The terminal state of a computation.
 */
template<typename V>
class Outcome
{
public:

    struct Failed
    {
        std::exception_ptr exception;
    };

    struct Aborted
    {
        std::string reason;
    };

private:

    std::variant<V, Failed, Aborted> raw;

    explicit Outcome(std::variant<V, Failed, Aborted> raw)
        : raw(std::move(raw))
    {
    }

public:

    static Outcome ok(V value)
    {
        return Outcome(std::variant<V, Failed, Aborted>(std::in_place_index<0>, std::move(value)));
    }

    static Outcome failed(std::exception_ptr exception)
    {
        return Outcome(std::variant<V, Failed, Aborted>(std::in_place_index<1>, Failed{std::move(exception)}));
    }

    static Outcome aborted(std::string reason)
    {
        return Outcome(std::variant<V, Failed, Aborted>(std::in_place_index<2>, Aborted{std::move(reason)}));
    }

    bool isOk() const
    {
        return raw.index() == 0;
    }

    const V * value() const
    {
        return std::get_if<0>(&raw);
    }

    const Failed * failure() const
    {
        return std::get_if<1>(&raw);
    }

    const Aborted * abortion() const
    {
        return std::get_if<2>(&raw);
    }

    /**
     * @returns the value.
     * @throws the computation's own exception if it failed, or
     * `ComputationAborted` if it was aborted.
     */
    const V & get() const
    {
        if (auto v = value())
            return *v;
        if (auto f = failure())
            std::rethrow_exception(f->exception);
        throw ComputationAborted("computation aborted: %s", abortion()->reason);
    }
};

/**
 * Describe the exception currently being handled. Must be called
 * from a `catch` block.
 */
std::string describeCurrentException();

} // namespace memo
