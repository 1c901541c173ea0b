#include "memo/util/logging.hh"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace memo {

LoggerSettings loggerSettings;

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

class SimpleLogger : public Logger
{
public:

    bool systemd;

    SimpleLogger()
    {
        auto inSystemd = getenv("IN_SYSTEMD");
        systemd = inSystemd && std::string_view(inSystemd) == "1";
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        std::string prefix;

        if (systemd) {
            char c;
            switch (lvl) {
            case lvlError:
                c = '3';
                break;
            case lvlWarn:
                c = '4';
                break;
            case lvlNotice:
            case lvlInfo:
                c = '5';
                break;
            case lvlTalkative:
            case lvlChatty:
                c = '6';
                break;
            case lvlDebug:
            case lvlVomit:
                c = '7';
                break;
            default:
                c = '7';
                break;
            }
            prefix = std::string("<") + c + ">";
        }

        writeToStderr(prefix + std::string(s) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace.get());

        log(ei.level, oss.str());
    }
};

Verbosity verbosity = lvlInfo;

void writeToStderr(std::string_view s)
{
    /* Failing writes to stderr are ignored, so that cleanup code
       that logs keeps running when stderr has been closed. */
    while (!s.empty()) {
        auto res = ::write(STDERR_FILENO, s.data(), s.size());
        if (res == -1) {
            if (errno == EINTR)
                continue;
            return;
        }
        s.remove_prefix(res);
    }
}

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

void CapturingLogger::log(Verbosity lvl, std::string_view s)
{
    if (lvl > verbosity)
        return;
    std::lock_guard<std::mutex> guard(lock);
    lines.emplace_back(lvl, std::string(s));
}

void CapturingLogger::logEI(const ErrorInfo & ei)
{
    std::ostringstream oss;
    showErrorInfo(oss, ei, loggerSettings.showTrace.get());
    log(ei.level, oss.str());
}

std::vector<std::pair<Verbosity, std::string>> CapturingLogger::captured()
{
    std::lock_guard<std::mutex> guard(lock);
    return lines;
}

void ignoreException(Verbosity lvl)
{
    /* Make sure no exceptions leave this function.
       printError() also throws when remote is closed. */
    try {
        try {
            throw;
        } catch (Error & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.message());
        } catch (std::exception & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
        }
    } catch (...) {
    }
}

} // namespace memo
