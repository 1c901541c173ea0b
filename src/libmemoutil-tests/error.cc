#include "memo/util/error.hh"
#include "memo/util/logging.hh"
#include "memo/util/signals.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <sstream>

namespace memo {

using testing::HasSubstr;

MakeError(TestError, Error);

/* ----------------------------------------------------------------------------
 * BaseError
 * --------------------------------------------------------------------------*/

TEST(BaseError, whatIsPrefixedWithLevel)
{
    Error e("value %s is out of range", 42);
    ASSERT_EQ(e.message(), "value 42 is out of range");
    ASSERT_EQ(std::string(e.what()), "error: value 42 is out of range");
}

TEST(BaseError, makeErrorKeepsHierarchy)
{
    try {
        throw TestError("boom");
    } catch (Error & e) {
        ASSERT_EQ(e.message(), "boom");
        ASSERT_NE(dynamic_cast<TestError *>(&e), nullptr);
    }
}

TEST(BaseError, interruptedIsNotAnError)
{
    Interrupted e("interrupted");
    ASSERT_EQ(dynamic_cast<Error *>(static_cast<BaseError *>(&e)), nullptr);
}

TEST(BaseError, addTraceShowsContext)
{
    Error e("cannot compute");
    ASSERT_FALSE(e.hasTrace());
    e.addTrace("while computing key '%s'", "k");
    ASSERT_TRUE(e.hasTrace());
    ASSERT_THAT(e.what(), HasSubstr("while computing key 'k'"));
    ASSERT_THAT(e.what(), HasSubstr("error: cannot compute"));
}

TEST(BaseError, longTracesAreTruncated)
{
    ErrorInfo info{.level = lvlError, .msg = HintFmt("outer")};
    for (int i = 0; i < 5; ++i)
        info.traces.push_back(Trace{.hint = HintFmt("frame %d", i)});

    std::ostringstream truncated;
    showErrorInfo(truncated, info, false);
    ASSERT_THAT(truncated.str(), HasSubstr("frame 2"));
    ASSERT_THAT(truncated.str(), testing::Not(HasSubstr("frame 3")));
    ASSERT_THAT(truncated.str(), HasSubstr("trace truncated"));

    std::ostringstream full;
    showErrorInfo(full, info, true);
    ASSERT_THAT(full.str(), HasSubstr("frame 4"));
}

TEST(BaseError, preparedErrorKeepsItsText)
{
    Error e("key %s has no value", "k");
    e.prepareForSharing();

    auto what = e.what();
    auto & message = e.message();
    ASSERT_EQ(message, "key k has no value");
    ASSERT_EQ(std::string(what), "error: key k has no value");

    ASSERT_EQ(e.what(), what);
    ASSERT_EQ(&e.message(), &message);
    ASSERT_EQ(e.msg(), what);
}

TEST(BaseError, exitStatus)
{
    Error e(3, "exit with %d", 3);
    ASSERT_EQ(e.info().status, 3u);
    e.withExitStatus(7);
    ASSERT_EQ(e.info().status, 7u);
}

TEST(SysError, includesStrerror)
{
    SysError e(ENOENT, "opening '%s'", "/nonexistent");
    ASSERT_THAT(e.message(), HasSubstr("opening '/nonexistent'"));
    ASSERT_THAT(e.message(), HasSubstr(strerror(ENOENT)));
    ASSERT_EQ(e.errNo, ENOENT);
}

/* ----------------------------------------------------------------------------
 * Logger
 * --------------------------------------------------------------------------*/

class CapturingLoggerTest : public testing::Test
{
protected:
    std::unique_ptr<Logger> savedLogger;
    Verbosity savedVerbosity = verbosity;
    CapturingLogger * capture = nullptr;

    void SetUp() override
    {
        auto l = std::make_unique<CapturingLogger>();
        capture = l.get();
        savedLogger = std::exchange(logger, std::move(l));
    }

    void TearDown() override
    {
        logger = std::move(savedLogger);
        verbosity = savedVerbosity;
    }
};

TEST_F(CapturingLoggerTest, messagesAboveVerbosityAreDropped)
{
    verbosity = lvlInfo;
    printError("shown %d", 1);
    debug("hidden %d", 2);

    auto lines = capture->captured();
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].first, lvlError);
    ASSERT_EQ(lines[0].second, "shown 1");
}

TEST_F(CapturingLoggerTest, warnUsesErrorInfo)
{
    warn("careful with %s", "that");

    auto lines = capture->captured();
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].first, lvlWarn);
    ASSERT_THAT(lines[0].second, HasSubstr("warning: careful with that"));
}

TEST_F(CapturingLoggerTest, ignoreExceptionLogsTheError)
{
    try {
        throw Error("cannot store '%s'", "x");
    } catch (...) {
        ignoreException();
    }

    auto lines = capture->captured();
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_THAT(lines[0].second, HasSubstr("error (ignored): cannot store 'x'"));
}

} // namespace memo
