#include <gtest/gtest.h>
#include <any>
#include <sstream>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "cli/CancellationToken.hpp"
#include "cli/CommandContext.hpp"
#include "core/ArgumentParser.hpp"
#include "core/CommandRouter.hpp"

using namespace clicore;
using namespace clicore::test::utils;

class CommandContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        def = makeCommand("serve");
        def.options.push_back(makeOption<int>("port", 'p', "Port", false, 8080));
        def.options.push_back(makeOption<std::string>("host", std::nullopt, "Host", false, std::string("localhost")));
        def.options.push_back(makeOption<bool>("verbose", 'v'));
        def.options.push_back(makeOption<double>("ratio"));
        def.arguments.push_back(makeArgument<std::string>("root", "", false, std::string("."), 0));
        def.arguments.push_back(makeArgument<int>("workers", "", false, 4, 1));
        registry.registerCommand(def);
    }

    // Parses and binds args the way the application does.
    CommandContext makeContext(const std::vector<std::string>& args) {
        CommandRouter router(registry);
        const CommandDefinition* stored = registry.tryGetCommand("serve");
        ParsedArguments parsed = router.parseArguments(args);
        router.bindToDefinition(*stored, parsed);
        return CommandContext(std::move(parsed), args, {"serve"}, stored, sink);
    }

    CommandDefinition def;
    CommandRegistry registry;
    CapturingOutputSink sink;
};

// Test: declared default applies when the option is absent
TEST_F(CommandContextTest, DeclaredDefault) {
    auto ctx = makeContext({});

    EXPECT_EQ(ctx.getOption<int>("port"), 8080);
    EXPECT_EQ(ctx.getOption<std::string>("host"), "localhost");
}

// Test: supplied value wins, by long or short spelling
TEST_F(CommandContextTest, SuppliedValue) {
    EXPECT_EQ(makeContext({"-p", "3000"}).getOption<int>("port"), 3000);
    EXPECT_EQ(makeContext({"--port=4000"}).getOption<int>("port"), 4000);
    EXPECT_EQ(makeContext({"--port=4000"}).getOption<int>("p"), 4000);
}

// Test: unparsable supplied value falls back to the declared default
TEST_F(CommandContextTest, UnparsableFallsBackToDefault) {
    auto ctx = makeContext({"--port=abc"});

    EXPECT_EQ(ctx.getOption<int>("port"), 8080);
}

// Test: no value and no default gives the type's zero value
TEST_F(CommandContextTest, ZeroValueWithoutDefault) {
    auto ctx = makeContext({});

    EXPECT_DOUBLE_EQ(ctx.getOption<double>("ratio"), 0.0);
    EXPECT_EQ(ctx.getOption<std::string>("undeclared"), "");
    EXPECT_EQ(ctx.getOption<int>("undeclared"), 0);
}

// Test: a present flag reads as true, absent as false
TEST_F(CommandContextTest, BooleanFlags) {
    EXPECT_TRUE(makeContext({"--verbose"}).getOption<bool>("verbose"));
    EXPECT_TRUE(makeContext({"-v"}).getOption<bool>("verbose"));
    EXPECT_FALSE(makeContext({"--verbose=false"}).getOption<bool>("verbose"));
    EXPECT_FALSE(makeContext({}).getOption<bool>("verbose"));
}

// Test: arguments follow the same fallback chain
TEST_F(CommandContextTest, Arguments) {
    auto defaults = makeContext({});
    EXPECT_EQ(defaults.getArgument<std::string>("root"), ".");
    EXPECT_EQ(defaults.getArgument<int>("workers"), 4);

    auto supplied = makeContext({"/srv", "8"});
    EXPECT_EQ(supplied.getArgument<std::string>("root"), "/srv");
    EXPECT_EQ(supplied.getArgument<int>("workers"), 8);

    auto bad = makeContext({"/srv", "many"});
    EXPECT_EQ(bad.getArgument<int>("workers"), 4);
}

// Test: command name, path and raw args
TEST_F(CommandContextTest, Metadata) {
    auto ctx = makeContext({"--verbose"});

    EXPECT_EQ(ctx.commandName(), "serve");
    ASSERT_EQ(ctx.rawArgs().size(), 1u);
    EXPECT_EQ(ctx.rawArgs()[0], "--verbose");
    ASSERT_NE(ctx.definition(), nullptr);
    EXPECT_EQ(ctx.definition()->name, "serve");
    EXPECT_TRUE(ctx.hasOption("VERBOSE"));
}

// Test: multi-word command name
TEST_F(CommandContextTest, CommandNameJoinsPath) {
    CommandContext ctx(ParsedArguments(), {}, {"git", "remote", "add"}, nullptr, sink);

    EXPECT_EQ(ctx.commandName(), "git remote add");
    EXPECT_EQ(ctx.getOption<int>("anything"), 0);
}

// Test: items carry values between middleware and command
TEST_F(CommandContextTest, Items) {
    auto ctx = makeContext({});
    ctx.items()["user"] = std::string("alice");

    ASSERT_EQ(ctx.items().count("user"), 1u);
    EXPECT_EQ(std::any_cast<std::string>(ctx.items()["user"]), "alice");
}

// Test: output goes to the injected sink
TEST_F(CommandContextTest, OutputSink) {
    auto ctx = makeContext({});
    ctx.output().writeLine("hello");
    ctx.output().writeError("oops");

    ASSERT_EQ(sink.lines.size(), 1u);
    EXPECT_EQ(sink.lines[0], "hello");
    ASSERT_EQ(sink.errors.size(), 1u);
    EXPECT_EQ(sink.errors[0], "oops");
}

// Test: cancellation is shared across copies
TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;

    EXPECT_FALSE(copy.isCancellationRequested());
    token.cancel();
    EXPECT_TRUE(copy.isCancellationRequested());
}

// Test: stream sink separates normal and error output
TEST(StreamOutputSinkTest, WritesToStreams) {
    std::ostringstream out;
    std::ostringstream err;
    StreamOutputSink sink(out, err);

    sink.writeLine("first");
    sink.writeLine("second");
    sink.writeError("bad");

    EXPECT_EQ(out.str(), "first\nsecond\n");
    EXPECT_EQ(err.str(), "bad\n");
}
