#include "memo/util/configuration.hh"
#include "memo/util/error.hh"
#include "memo/util/logging.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace memo {

/* ----------------------------------------------------------------------------
 * Config::set
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    Setting<unsigned int> foo{&config, 0, "name-of-the-setting", "description"};
    ASSERT_FALSE(foo.isOverridden());
    ASSERT_EQ(config.set("name-of-the-setting", "7"), true);
    ASSERT_EQ(foo.get(), 7u);
    ASSERT_TRUE(foo.isOverridden());
}

TEST(Config, assignmentDoesNotOverride)
{
    Config config;
    Setting<int> foo{&config, 1, "foo", "description"};
    foo = 2;
    ASSERT_EQ(foo.get(), 2);
    ASSERT_FALSE(foo.isOverridden());
}

TEST(Config, withInitialValue)
{
    const StringMap initials = {
        {"key", "12"},
    };
    Config config(initials);

    Setting<int> setting{&config, 5, "key", "description"};
    ASSERT_EQ(setting.get(), 12);
    ASSERT_TRUE(setting.isOverridden());
}

TEST(Config, initialValueByAlias)
{
    StringMap initials{{"old-name", "3"}};
    Config config(initials);
    Setting<unsigned int> setting{&config, 0, "new-name", "description", {"old-name"}};
    ASSERT_EQ(setting.get(), 3u);
}

TEST(Config, setSettingAlias)
{
    Config config;
    Setting<int> setting{&config, 0, "some-int", "best number", {"another-int"}};
    ASSERT_TRUE(config.set("some-int", "1"));
    ASSERT_EQ(setting.get(), 1);
    ASSERT_TRUE(config.set("another-int", "2"));
    ASSERT_EQ(setting.get(), 2);
}

TEST(Config, integerSettingsAcceptUnitSuffixes)
{
    Config config;
    Setting<uint64_t> capacity{&config, 0, "capacity", "entries"};

    ASSERT_TRUE(config.set("capacity", "4K"));
    ASSERT_EQ(capacity.get(), 4096u);
    ASSERT_TRUE(config.set("capacity", "2m"));
    ASSERT_EQ(capacity.get(), 2u << 20);

    ASSERT_THROW(config.set("capacity", "many"), UsageError);
    ASSERT_THROW(config.set("capacity", "-1"), UsageError);
    ASSERT_EQ(capacity.get(), 2u << 20);
}

TEST(Config, booleanSettings)
{
    Config config;
    Setting<bool> flag{&config, false, "flag", "a flag"};

    ASSERT_TRUE(config.set("flag", "yes"));
    ASSERT_TRUE(flag.get());
    ASSERT_TRUE(config.set("flag", "false"));
    ASSERT_FALSE(flag.get());
    ASSERT_THROW(config.set("flag", "maybe"), UsageError);
}

/* ----------------------------------------------------------------------------
 * toJSON
 * --------------------------------------------------------------------------*/

TEST(Config, toJSONOnEmptyConfig)
{
    ASSERT_EQ(Config().toJSON().dump(), "{}");
}

TEST(Config, toJSONOnNonEmptyConfig)
{
    Config config;
    Setting<unsigned int> setting{
        &config,
        1,
        "name-of-the-setting",
        R"(
          description
        )",
        {"alias"}};
    setting = 4;

    ASSERT_EQ(config.toJSON(), nlohmann::json::parse(R"#({
        "name-of-the-setting": {
            "aliases": ["alias"],
            "defaultValue": 1,
            "description": "\ndescription\n\n",
            "value": 4
        }
    })#"));
}

/* ----------------------------------------------------------------------------
 * applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfigEmpty)
{
    Config config;
    config.applyConfig("");
    config.applyConfig("# just a comment");
    ASSERT_EQ(config.toJSON().dump(), "{}");
}

TEST(Config, applyConfigAssignment)
{
    Config config;
    Setting<int> setting{&config, 0, "name-of-the-setting", "description"};
    config.applyConfig(
        "name-of-the-setting = 10 #useful comment\n"
        "# name-of-the-setting = 20\n");
    ASSERT_EQ(setting.get(), 10);
}

TEST(Config, applyConfigWithReassignedSetting)
{
    Config config;
    Setting<int> setting{&config, 0, "name-of-the-setting", "description"};
    config.applyConfig(
        "name-of-the-setting = 1\n"
        "name-of-the-setting = 2\n");
    ASSERT_EQ(setting.get(), 2);
}

TEST(Config, applyConfigKeepsUnknownSettings)
{
    Config config;
    config.applyConfig("later = 5\n");

    Setting<unsigned int> later{&config, 0, "later", "registered after the file was read"};
    ASSERT_EQ(later.get(), 5u);
}

TEST(Config, applyConfigInvalidThrows)
{
    Config config;
    ASSERT_THROW(config.applyConfig("value == key"), UsageError);
    ASSERT_THROW(config.applyConfig("value "), UsageError);
}

TEST(Config, warnUnknownSettings)
{
    auto capture = std::make_unique<CapturingLogger>();
    auto & captured = *capture;
    auto oldLogger = std::move(logger);
    logger = std::move(capture);

    Config config;
    Setting<int> known{&config, 0, "known", "description"};
    config.applyConfig("known = 1\nunknown = 2\n");
    config.warnUnknownSettings();

    auto lines = captured.captured();
    logger = std::move(oldLogger);

    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].first, lvlWarn);
    ASSERT_NE(lines[0].second.find("unknown setting 'unknown'"), std::string::npos);
}

} // namespace memo
