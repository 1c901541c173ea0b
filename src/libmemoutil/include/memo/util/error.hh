#pragma once
/**
 * @file
 *
 * @brief The exception hierarchy of memo.
 *
 * `ErrorInfo` is the payload of every error: a verbosity level, a
 * formatted message and an optional trace of context lines. Turning it
 * into text happens in `showErrorInfo()` (and thus in the logger), not
 * at the throw site.
 *
 * `BaseError` is the ancestor of all memo exceptions, `Interrupted`
 * included. Code that wants to handle failures should catch `Error`.
 */

#include "memo/util/fmt.hh"

#include <cstring>
#include <list>
#include <optional>
#include <source_location>
#include <string_view>

namespace memo {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

/**
 * One line of context added while an error propagates.
 */
struct Trace
{
    HintFmt hint;
};

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;
    std::list<Trace> traces;

    /**
     * Exit status.
     */
    unsigned int status = 1;

    static std::optional<std::string> programName;
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace);

/**
 * BaseError should generally not be caught, as it has Interrupted as
 * a subclass. Catch Error instead.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /**
     * Cached formatted contents of `err.msg`, with and without the
     * "error: " prefix and traces. Once both are filled in, inspecting
     * the error no longer modifies it, so one exception object may be
     * read from several threads at once.
     */
    mutable std::optional<std::string> what_;
    mutable std::optional<std::string> message_;

    const std::string & calcWhat() const;

public:
    BaseError(const BaseError &) = default;
    BaseError & operator=(const BaseError &) = default;
    BaseError & operator=(BaseError &&) = default;

    template<typename... Args>
    BaseError(unsigned int status, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(args...), .status = status}
    {
    }

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt hint)
        : err{.level = lvlError, .msg = hint}
    {
    }

    BaseError(ErrorInfo && e)
        : err(std::move(e))
    {
    }

    BaseError(const ErrorInfo & e)
        : err(e)
    {
    }

    /** The error message without "error: " prefixed to it. */
    const std::string & message() const
    {
        if (!message_)
            message_ = err.msg.str();
        return *message_;
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        calcWhat();
        return err;
    }

    void withExitStatus(unsigned int status)
    {
        err.status = status;
    }

    /**
     * Prepend a line of context to the error trace.
     */
    template<typename... Args>
    void addTrace(std::string_view fs, const Args &... args)
    {
        addTrace(HintFmt(std::string(fs), args...));
    }

    void addTrace(HintFmt hint);

    /**
     * Format the message now, so that later calls to `what()`,
     * `msg()` and `message()` only read.
     */
    void prepareForSharing() const
    {
        message();
        calcWhat();
    }

    bool hasTrace() const
    {
        return !err.traces.empty();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * To use in catch-blocks.
 */
MakeError(SystemError, Error);

/**
 * POSIX system error, created using `errno` and `strerror`.
 *
 * Throw this, but prefer to catch `SystemError`.
 */
class SysError : public SystemError
{
public:
    int errNo;

    /**
     * Construct using the explicitly-provided error number.
     */
    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError("")
        , errNo(errNo)
    {
        auto hf = HintFmt(args...);
        err.msg = HintFmt("%1%: %2%", Uncolored(hf.str()), strerror(errNo));
    }

    /**
     * Construct using the ambient `errno`. Do not perform another
     * `errno`-modifying operation before calling this constructor.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Print a message and std::terminate().
 */
[[noreturn]]
void panic(std::string_view msg);

/**
 * Print a basic error message with source position and std::terminate().
 */
[[gnu::noinline, gnu::cold, noreturn]] void unreachable(std::source_location loc = std::source_location::current());

} // namespace memo
