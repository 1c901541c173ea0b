#include "memo/util/strings.hh"
#include "memo/util/error.hh"

#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

namespace memo {

/* ----------------------------------------------------------------------------
 * tokenizeString / concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    ASSERT_EQ(tokenizeString<Strings>(""), Strings{});
}

TEST(tokenizeString, dropsEmptyTokens)
{
    Strings expected = {"foo", "bar", "baz"};
    ASSERT_EQ(tokenizeString<Strings>("  foo \tbar\n\nbaz "), expected);
}

TEST(tokenizeString, customSeparators)
{
    std::vector<std::string> expected = {"a", "b", "c"};
    ASSERT_EQ(tokenizeString<std::vector<std::string>>("a,b;;c", ",;"), expected);
}

TEST(concatStringsSep, empty)
{
    ASSERT_EQ(concatStringsSep(",", Strings{}), "");
}

TEST(concatStringsSep, joinsWithSeparator)
{
    ASSERT_EQ(concatStringsSep(", ", Strings{"one", "two", "three"}), "one, two, three");
}

// concatStringsSep sep . tokenizeString sep = id   for strings without empty tokens
RC_GTEST_PROP(tokenizeString, recoveredByConcatStringsSep, (const std::vector<std::string> & words))
{
    std::vector<std::string> tokens;
    for (auto & w : words)
        if (!w.empty() && w.find(' ') == w.npos)
            tokens.push_back(w);
    auto joined = concatStringsSep(" ", tokens);
    RC_ASSERT(tokenizeString<std::vector<std::string>>(joined, " ") == tokens);
}

/* ----------------------------------------------------------------------------
 * trim / chomp / hasPrefix
 * --------------------------------------------------------------------------*/

TEST(trim, removesWhitespaceOnBothSides)
{
    ASSERT_EQ(trim("  foo bar \n"), "foo bar");
    ASSERT_EQ(trim("   "), "");
}

TEST(chomp, removesTrailingWhitespaceOnly)
{
    ASSERT_EQ(chomp("  foo \n\t"), "  foo");
}

TEST(hasPrefix, basic)
{
    ASSERT_TRUE(hasPrefix("extra-foo", "extra-"));
    ASSERT_FALSE(hasPrefix("extr", "extra-"));
}

TEST(stripIndentation, removesCommonIndentation)
{
    ASSERT_EQ(stripIndentation("\n    foo\n      bar\n    "), "\nfoo\n  bar\n\n");
}

/* ----------------------------------------------------------------------------
 * string2Int / string2IntWithUnitPrefix
 * --------------------------------------------------------------------------*/

TEST(string2Int, parsesIntegers)
{
    ASSERT_EQ(string2Int<int>("-12"), -12);
    ASSERT_EQ(string2Int<unsigned int>("12"), 12u);
    ASSERT_EQ(string2Int<unsigned int>("-12"), std::nullopt);
    ASSERT_EQ(string2Int<int>("12x"), std::nullopt);
}

TEST(string2IntWithUnitPrefix, appliesBinaryPrefixes)
{
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("3"), 3u);
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("2k"), 2048u);
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("1M"), 1u << 20);
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("1G"), 1u << 30);
    ASSERT_THROW(string2IntWithUnitPrefix<uint64_t>("1X"), UsageError);
    ASSERT_THROW(string2IntWithUnitPrefix<uint64_t>("K"), UsageError);
}

RC_GTEST_PROP(string2Int, roundTripsUnsigned, (unsigned long n))
{
    RC_ASSERT(string2Int<unsigned long>(std::to_string(n)) == n);
}

} // namespace memo
