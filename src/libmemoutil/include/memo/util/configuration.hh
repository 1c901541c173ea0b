#pragma once
///@file

#include "memo/util/types.hh"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <string>
#include <type_traits>

namespace memo {

class AbstractSetting;

/**
 * A collection of uniquely named settings. The typical use is to
 * inherit `Config` and add `Setting<T>` members, each of which
 * registers itself under its name and aliases:
 *
 *   struct CacheSettings : Config
 *   {
 *       Setting<uint64_t> maxCapacity{this, 10000, "max-capacity", "the number of entries to keep"};
 *   };
 *
 * Values are assigned from text, one at a time with `set()` or from a
 * configuration file with `applyConfig()`. Assignments to names that
 * are not registered are remembered and applied when a setting of that
 * name is registered.
 */
class Config
{
    friend class AbstractSetting;

    template<typename T>
    friend class Setting;

    struct Registration
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    std::map<std::string, Registration, std::less<>> registered;

    StringMap unknownSettings;

    void addSetting(AbstractSetting * setting);

public:

    Config(StringMap initials = {});

    /* Settings point back into the object that registered them. */
    Config(const Config &) = delete;
    Config & operator=(const Config &) = delete;

    virtual ~Config() = default;

    /**
     * Assign `value` to the setting called `name` (or one of its
     * aliases).
     *
     * @returns false if there is no such setting.
     * @throws UsageError if `value` is not valid for the setting.
     */
    bool set(const std::string & name, const std::string & value);

    /**
     * Apply `name = value` lines. `#` starts a comment.
     *
     * @param path where `contents` came from, for error messages.
     * @throws UsageError on a malformed line or value.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    /**
     * Log a warning for every assignment to a name that no setting
     * has claimed.
     */
    void warnUnknownSettings() const;

    /**
     * Every setting (aliases excluded) with its value, default value,
     * description and aliases.
     */
    nlohmann::json toJSON() const;
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;
    const StringSet aliases;

    /**
     * Whether the value was assigned from text rather than left at
     * its default.
     */
    bool isOverridden() const
    {
        return overridden;
    }

protected:

    bool overridden = false;

    AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases);

    virtual ~AbstractSetting() = default;

    /**
     * Parse `str` and make it the value.
     */
    virtual void set(const std::string & str) = 0;

    virtual std::string to_string() const = 0;

    virtual nlohmann::json toJSON() const;
};

/**
 * A boolean or integer setting. Integers accept the suffixes `K`,
 * `M`, `G` and `T`; booleans accept `true`/`yes`/`1` and
 * `false`/`no`/`0`.
 */
template<typename T>
class Setting : public AbstractSetting
{
    static_assert(std::is_integral_v<T>, "settings are booleans or integers");

    T value;
    const T defaultValue;

    T parse(const std::string & str) const;

protected:

    void set(const std::string & str) override
    {
        value = parse(str);
    }

    std::string to_string() const override;

    nlohmann::json toJSON() const override;

public:

    Setting(
        Config * config,
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
        , defaultValue(def)
    {
        config->addSetting(this);
    }

    const T & get() const
    {
        return value;
    }

    operator const T &() const
    {
        return value;
    }

    void operator=(const T & v)
    {
        value = v;
    }
};

extern template class Setting<bool>;
extern template class Setting<int>;
extern template class Setting<unsigned int>;
extern template class Setting<long>;
extern template class Setting<unsigned long>;
extern template class Setting<long long>;
extern template class Setting<unsigned long long>;

} // namespace memo
