#include "memo/util/error.hh"
#include "memo/util/logging.hh"
#include "memo/util/strings.hh"

#include <iostream>
#include <sstream>

namespace memo {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

// c++ std::exception descendants must have a 'const char* what()' function.
// This stringifies the error and caches it for use by what(), or similarly by msg().
const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace);
        what_ = oss.str();
        return *what_;
    }
}

std::optional<std::string> ErrorInfo::programName = std::nullopt;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

static std::string indent(std::string_view indentFirst, std::string_view indentRest, std::string_view s)
{
    std::string res;
    bool first = true;

    while (!s.empty()) {
        auto end = s.find('\n');
        if (!first)
            res += "\n";
        res += chomp(std::string(first ? indentFirst : indentRest) + std::string(s.substr(0, end)));
        first = false;
        if (end == s.npos)
            break;
        s = s.substr(end + 1);
    }

    return res;
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string prefix;
    switch (einfo.level) {
    case lvlError:
        prefix = ANSI_RED "error";
        break;
    case lvlNotice:
        prefix = ANSI_RED "note";
        break;
    case lvlWarn:
        prefix = ANSI_WARNING "warning";
        break;
    case lvlInfo:
        prefix = ANSI_GREEN "info";
        break;
    case lvlTalkative:
        prefix = ANSI_GREEN "talk";
        break;
    case lvlChatty:
        prefix = ANSI_GREEN "chat";
        break;
    case lvlDebug:
        prefix = ANSI_WARNING "debug";
        break;
    case lvlVomit:
        prefix = ANSI_GREEN "vomit";
        break;
    }

    if (ErrorInfo::programName)
        prefix += fmt(" [%s]:" ANSI_NORMAL " ", *ErrorInfo::programName);
    else
        prefix += ":" ANSI_NORMAL " ";

    std::ostringstream oss;

    /* Only the three innermost context lines are shown unless
       `show-trace` is set. */
    if (!einfo.traces.empty()) {
        size_t count = 0;
        bool truncated = false;

        for (const auto & trace : einfo.traces) {
            auto line = trace.hint.str();
            if (line.empty())
                continue;
            if (!showTrace && count >= 3) {
                truncated = true;
                break;
            }
            oss << "\n" << "… " << line << "\n";
            count++;
        }

        if (truncated)
            oss << "\n" << ANSI_WARNING "(trace truncated; set 'show-trace' to show the full trace)" ANSI_NORMAL << "\n";

        oss << "\n" << prefix;
    }

    oss << einfo.msg << "\n";

    out << indent(prefix, std::string(prefix.size(), ' '), chomp(oss.str()));

    return out;
}

void panic(std::string_view msg)
{
    writeToStderr(std::string("memo: ") + std::string(msg) + "\n");
    std::terminate();
}

void unreachable(std::source_location loc)
{
    panic(fmt("unexpected condition in %s at %s:%d", loc.function_name(), loc.file_name(), loc.line()));
}

} // namespace memo
