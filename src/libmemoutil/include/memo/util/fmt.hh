#pragma once
///@file

#include <boost/format.hpp>
#include <string>
#include <string_view>

#include "memo/util/ansicolor.hh"

namespace memo {

/**
 * Interpolate `args` into `f`, i.e. `f % a_0 % ... % a_n`.
 */
template<class F>
inline void formatHelper(F & f)
{
}

template<class F, typename T, typename... Args>
inline void formatHelper(F & f, const T & x, const Args &... args)
{
    formatHelper(f % x, args...);
}

/**
 * Missing or surplus arguments are tolerated; every other formatting
 * error throws.
 */
inline void setExceptions(boost::format & fmt)
{
    fmt.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * Format a string with `boost::format` placeholders.
 *
 * With a single argument the string is returned unchanged, so a
 * message that happens to contain `%` never reaches the formatter:
 *
 * ```
 * fmt(userSuppliedKey);              // returned as-is
 * fmt("key '%s' is pending", key);   // interpolated
 * ```
 */
inline std::string fmt(const std::string & s)
{
    return s;
}

inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    formatHelper(f, args...);
    return f.str();
}

/**
 * Values wrapped in this struct are highlighted when colour output is
 * compiled in. `HintFmt` wraps every interpolated argument in it.
 */
template<class T>
struct Magenta
{
    Magenta(const T & s)
        : value(s)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & y)
{
    return out << ANSI_WARNING << y.value << ANSI_NORMAL;
}

/**
 * Values wrapped in this struct are interpolated without highlighting.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s)
        : value(s)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Uncolored<T> & y)
{
    return out << ANSI_NORMAL << y.value;
}

/**
 * A `boost::format` that highlights interpolated arguments. This is the
 * message type of every `BaseError`.
 */
class HintFmt
{
private:
    boost::format fmt;

public:
    /**
     * Use `literal` verbatim, without interpreting placeholders.
     */
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : HintFmt(boost::format(format), args...)
    {
    }

    HintFmt(const HintFmt & hf)
        : fmt(hf.fmt)
    {
    }

    template<typename... Args>
    HintFmt(boost::format && fmt, const Args &... args)
        : fmt(std::move(fmt))
    {
        setExceptions(this->fmt);
        formatHelper(*this, args...);
    }

    template<class T>
    HintFmt & operator%(const T & value)
    {
        fmt % Magenta(value);
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        fmt % value.value;
        return *this;
    }

    std::string str() const
    {
        return fmt.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace memo
