#include "memo/util/configuration.hh"
#include "memo/util/logging.hh"
#include "memo/util/strings.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace memo {

Config::Config(StringMap initials)
    : unknownSettings(std::move(initials))
{
}

void Config::addSetting(AbstractSetting * setting)
{
    registered.emplace(setting->name, Registration{false, setting});
    for (auto & alias : setting->aliases)
        registered.emplace(alias, Registration{true, setting});

    /* Pick up values that were assigned before the setting existed,
       by name first, then by alias. */
    std::optional<std::string> claimedBy;

    auto claim = [&](const std::string & name) {
        auto i = unknownSettings.find(name);
        if (i == unknownSettings.end())
            return;
        if (claimedBy)
            warn("setting '%s' is set, but it's an alias of '%s' which is also set", name, *claimedBy);
        else {
            setting->set(i->second);
            setting->overridden = true;
            claimedBy = name;
        }
        unknownSettings.erase(i);
    };

    claim(setting->name);
    for (auto & alias : setting->aliases)
        claim(alias);
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = registered.find(name);
    if (i == registered.end())
        return false;
    i->second.setting->set(value);
    i->second.setting->overridden = true;
    return true;
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    for (auto & line : tokenizeString<std::vector<std::string>>(contents, "\n")) {
        if (auto hash = line.find('#'); hash != line.npos)
            line.resize(hash);

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        if (tokens.size() < 2 || tokens[1] != "=")
            throw UsageError("syntax error in configuration line '%1%' in '%2%'", trim(line), path);

        auto value = concatStringsSep(" ", std::vector<std::string>(tokens.begin() + 2, tokens.end()));

        if (!set(tokens[0], value))
            unknownSettings.insert_or_assign(tokens[0], std::move(value));
    }
}

void Config::warnUnknownSettings() const
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

nlohmann::json Config::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, reg] : registered)
        if (!reg.isAlias)
            res.emplace(name, reg.setting->toJSON());
    return res;
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases)
    : name(name)
    , description(stripIndentation(description))
    , aliases(aliases)
{
}

nlohmann::json AbstractSetting::toJSON() const
{
    return {
        {"description", description},
        {"aliases", aliases},
        {"value", to_string()},
    };
}

template<typename T>
T Setting<T>::parse(const std::string & str) const
{
    if constexpr (std::is_same_v<T, bool>) {
        if (str == "true" || str == "yes" || str == "1")
            return true;
        if (str == "false" || str == "no" || str == "0")
            return false;
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
    } else {
        try {
            return string2IntWithUnitPrefix<T>(str);
        } catch (UsageError &) {
            throw UsageError("setting '%s' has invalid value '%s'", name, str);
        }
    }
}

template<typename T>
std::string Setting<T>::to_string() const
{
    if constexpr (std::is_same_v<T, bool>)
        return value ? "true" : "false";
    else
        return std::to_string(value);
}

template<typename T>
nlohmann::json Setting<T>::toJSON() const
{
    auto res = AbstractSetting::toJSON();
    res["value"] = value;
    res["defaultValue"] = defaultValue;
    return res;
}

template class Setting<bool>;
template class Setting<int>;
template class Setting<unsigned int>;
template class Setting<long>;
template class Setting<unsigned long>;
template class Setting<long long>;
template class Setting<unsigned long long>;

} // namespace memo
