#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/ArgumentParser.hpp"

using namespace clicore;

class ArgumentParserTest : public ::testing::Test {
protected:
    ArgumentParser parser;
};

// Test: --name=value records an explicit value
TEST_F(ArgumentParserTest, LongOptionWithEquals) {
    auto result = parser.parse({"--name=John"});

    EXPECT_TRUE(result.hasOption("name"));
    EXPECT_EQ(result.optionValue("name"), "John");
}

// Test: value may itself contain '='
TEST_F(ArgumentParserTest, LongOptionSplitsOnFirstEquals) {
    auto result = parser.parse({"--define=key=value"});

    EXPECT_EQ(result.optionValue("define"), "key=value");
}

// Test: empty explicit value is still a value
TEST_F(ArgumentParserTest, LongOptionWithEmptyValue) {
    auto result = parser.parse({"--name="});

    ASSERT_TRUE(result.hasOption("name"));
    ASSERT_EQ(result.optionValues("name").size(), 1u);
    EXPECT_EQ(result.optionValues("name")[0], "");
}

// Test: long options never consume the next token
TEST_F(ArgumentParserTest, LongOptionDoesNotConsumeNextToken) {
    auto result = parser.parse({"--name", "John"});

    EXPECT_TRUE(result.hasOption("name"));
    EXPECT_FALSE(result.optionValue("name").has_value());
    ASSERT_EQ(result.positional().size(), 1u);
    EXPECT_EQ(result.positional()[0], "John");
}

// Test: -n value
TEST_F(ArgumentParserTest, ShortOptionWithValue) {
    auto result = parser.parse({"-n", "John"});

    EXPECT_TRUE(result.hasOption("n"));
    EXPECT_EQ(result.optionValue("n"), "John");
    EXPECT_TRUE(result.positional().empty());
}

// Test: short option followed by another option is a flag
TEST_F(ArgumentParserTest, ShortOptionFollowedByOptionIsFlag) {
    auto result = parser.parse({"-v", "--name=x"});

    EXPECT_TRUE(result.hasOption("v"));
    EXPECT_TRUE(result.optionValues("v").empty());
    EXPECT_EQ(result.optionValue("name"), "x");
}

// Test: short option at end of input is a flag
TEST_F(ArgumentParserTest, ShortOptionAtEndIsFlag) {
    auto result = parser.parse({"-v"});

    EXPECT_TRUE(result.hasOption("v"));
    EXPECT_FALSE(result.optionValue("v").has_value());
}

// Test: -abc expands to three flags
TEST_F(ArgumentParserTest, CombinedShortOptions) {
    auto result = parser.parse({"-abc"});

    EXPECT_TRUE(result.hasOption("a"));
    EXPECT_TRUE(result.hasOption("b"));
    EXPECT_TRUE(result.hasOption("c"));
    EXPECT_TRUE(result.optionValues("a").empty());
    EXPECT_TRUE(result.optionValues("b").empty());
    EXPECT_TRUE(result.optionValues("c").empty());
}

// Test: combined flags never consume a value
TEST_F(ArgumentParserTest, CombinedShortOptionsDoNotConsumeValue) {
    auto result = parser.parse({"-am", "message"});

    EXPECT_TRUE(result.hasOption("a"));
    EXPECT_TRUE(result.hasOption("m"));
    EXPECT_FALSE(result.optionValue("m").has_value());
    ASSERT_EQ(result.positional().size(), 1u);
    EXPECT_EQ(result.positional()[0], "message");
}

// Test: with expansion disabled the suffix is one option name
TEST_F(ArgumentParserTest, CombinedShortOptionsDisabled) {
    ParserOptions options;
    options.allowCombinedShortOptions = false;
    ArgumentParser strict(options);

    auto result = strict.parse({"-abc"});

    EXPECT_TRUE(result.hasOption("abc"));
    EXPECT_FALSE(result.hasOption("a"));
}

// Test: Windows style /name value when enabled
TEST_F(ArgumentParserTest, WindowsStyleOption) {
    ParserOptions options;
    options.allowWindowsStyle = true;
    ArgumentParser windows(options);

    auto result = windows.parse({"/name", "John"});

    EXPECT_TRUE(result.hasOption("name"));
    EXPECT_EQ(result.optionValue("name"), "John");
}

// Test: with Windows style enabled, a following /token is option-like
TEST_F(ArgumentParserTest, WindowsStyleLookaheadTreatsSlashAsOption) {
    ParserOptions options;
    options.allowWindowsStyle = true;
    ArgumentParser windows(options);

    auto result = windows.parse({"-o", "/verbose"});

    EXPECT_TRUE(result.hasOption("o"));
    EXPECT_FALSE(result.optionValue("o").has_value());
    EXPECT_TRUE(result.hasOption("verbose"));
}

// Test: Windows style is opt-in; paths stay positional by default
TEST_F(ArgumentParserTest, SlashTokensArePositionalByDefault) {
    auto result = parser.parse({"-o", "/tmp/out.txt"});

    EXPECT_EQ(result.optionValue("o"), "/tmp/out.txt");

    auto positional = parser.parse({"/tmp/in.txt"});
    ASSERT_EQ(positional.positional().size(), 1u);
    EXPECT_EQ(positional.positional()[0], "/tmp/in.txt");
}

// Test: plain tokens are positional, in order
TEST_F(ArgumentParserTest, PositionalArguments) {
    auto result = parser.parse({"file1.txt", "file2.txt"});

    ASSERT_EQ(result.positional().size(), 2u);
    EXPECT_EQ(result.positionalAt(0), "file1.txt");
    EXPECT_EQ(result.positionalAt(1), "file2.txt");
    EXPECT_FALSE(result.positionalAt(2).has_value());
}

// Test: options and positionals interleave
TEST_F(ArgumentParserTest, MixedOptionsAndPositionals) {
    auto result = parser.parse({"--verbose", "file1.txt", "-o", "output.txt"});

    EXPECT_TRUE(result.hasOption("verbose"));
    EXPECT_EQ(result.optionValue("o"), "output.txt");
    ASSERT_EQ(result.positional().size(), 1u);
    EXPECT_EQ(result.positional()[0], "file1.txt");
}

// Test: -- ends option parsing
TEST_F(ArgumentParserTest, DoubleDashEndsOptions) {
    auto result = parser.parse({"--verbose", "--", "--not-an-option"});

    EXPECT_TRUE(result.hasOption("verbose"));
    EXPECT_FALSE(result.hasOption("not-an-option"));
    ASSERT_EQ(result.positional().size(), 1u);
    EXPECT_EQ(result.positional()[0], "--not-an-option");
}

// Test: a second -- after the terminator is positional
TEST_F(ArgumentParserTest, SecondDoubleDashIsPositional) {
    auto result = parser.parse({"--", "-x", "--", "file"});

    std::vector<std::string> expected{"-x", "--", "file"};
    EXPECT_EQ(result.positional(), expected);
    EXPECT_FALSE(result.hasOption("x"));
}

// Test: flags carry no value
TEST_F(ArgumentParserTest, FlagOptionWithoutValue) {
    auto result = parser.parse({"--verbose", "--dry-run"});

    EXPECT_TRUE(result.hasOption("verbose"));
    EXPECT_TRUE(result.hasOption("dry-run"));
    EXPECT_FALSE(result.optionValue("verbose").has_value());
}

// Test: repeated options accumulate values
TEST_F(ArgumentParserTest, RepeatedOptionsAccumulate) {
    auto result = parser.parse({"--tag=a", "-t", "x", "--tag=b"});

    std::vector<std::string> expected{"a", "b"};
    EXPECT_EQ(result.optionValues("tag"), expected);
    EXPECT_EQ(result.optionValue("t"), "x");
}

// Test: lone dash is positional (conventional stdin marker)
TEST_F(ArgumentParserTest, LoneDashIsPositional) {
    auto result = parser.parse({"-"});

    ASSERT_EQ(result.positional().size(), 1u);
    EXPECT_EQ(result.positional()[0], "-");
    EXPECT_TRUE(result.optionNames().empty());
}

// Test: empty input yields nothing
TEST_F(ArgumentParserTest, EmptyInput) {
    auto result = parser.parse({});

    EXPECT_TRUE(result.positional().empty());
    EXPECT_TRUE(result.optionNames().empty());
}

// Test: option-like classification
TEST_F(ArgumentParserTest, IsOptionLike) {
    EXPECT_TRUE(parser.isOptionLike("-x"));
    EXPECT_TRUE(parser.isOptionLike("--x"));
    EXPECT_FALSE(parser.isOptionLike("/x"));
    EXPECT_FALSE(parser.isOptionLike("x"));
    EXPECT_FALSE(parser.isOptionLike(""));

    ParserOptions options;
    options.allowWindowsStyle = true;
    EXPECT_TRUE(ArgumentParser(options).isOptionLike("/x"));
}
