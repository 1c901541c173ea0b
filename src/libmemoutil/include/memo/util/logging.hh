#pragma once
///@file

#include "memo/util/error.hh"
#include "memo/util/configuration.hh"

#include <memory>
#include <mutex>
#include <vector>

namespace memo {

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this,
        false,
        "show-trace",
        R"(
          Whether to print the full trace of context lines attached to
          an error instead of only the innermost ones.
        )"};
};

extern LoggerSettings loggerSettings;

class Logger
{
public:

    virtual ~Logger() {}

    virtual void stop() {};

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    void log(std::string_view s)
    {
        log(lvlInfo, s);
    }

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);
};

/**
 * A logger that keeps the lines it receives in memory. The messages
 * are filtered by `verbosity` like every other logger.
 */
class CapturingLogger : public Logger
{
    std::mutex lock;
    std::vector<std::pair<Verbosity, std::string>> lines;

public:

    void log(Verbosity lvl, std::string_view s) override;

    void logEI(const ErrorInfo & ei) override;

    /**
     * The captured messages, oldest first.
     */
    std::vector<std::pair<Verbosity, std::string>> captured();
};

extern std::unique_ptr<Logger> logger;

std::unique_ptr<Logger> makeSimpleLogger();

/**
 * suppress msgs > this
 */
extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)      \
    do {                                       \
        if ((level) <= memo::verbosity) {      \
            logger->logEI((level), errorInfo); \
        }                                      \
    } while (0)

#define logError(errorInfo...) logErrorInfo(lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(lvlWarn, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily.
 */
#define printMsgUsing(loggerParam, level, args...) \
    do {                                           \
        auto __lvl = level;                        \
        if (__lvl <= memo::verbosity) {            \
            loggerParam->log(__lvl, fmt(args));    \
        }                                          \
    } while (0)
#define printMsg(level, args...) printMsgUsing(logger, level, args)

#define printError(args...) printMsg(lvlError, args)
#define notice(args...) printMsg(lvlNotice, args)
#define printInfo(args...) printMsg(lvlInfo, args)
#define printTalkative(args...) printMsg(lvlTalkative, args)
#define debug(args...) printMsg(lvlDebug, args)
#define vomit(args...) printMsg(lvlVomit, args)

/**
 * if verbosity >= lvlWarn, print a message with a 'warning:' prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    formatHelper(f, args...);
    logger->warn(f.str());
}

void writeToStderr(std::string_view s);

/**
 * Log the exception currently being handled at `lvl` instead of
 * propagating it. Must be called from a catch block.
 */
void ignoreException(Verbosity lvl = lvlError);

} // namespace memo
