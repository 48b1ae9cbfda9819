#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "core/CommandRouter.hpp"
#include "middleware/MiddlewarePipeline.hpp"
#include "middleware/ValidationMiddleware.hpp"
#include "validation/DefaultArgumentValidator.hpp"

using namespace clicore;
using namespace clicore::test::utils;

namespace {

// Rejects every invocation with a fixed message.
class RejectAllValidator : public IArgumentValidator {
public:
    ValidationResult validate(const ParsedArguments&, const CommandDefinition&) const override {
        ValidationResult result;
        result.addError("Always wrong.");
        return result;
    }
};

}

class ValidationMiddlewareTest : public ::testing::Test {
protected:
    void SetUp() override {
        CommandDefinition def = makeCommand("deploy");
        def.options.push_back(makeOption<std::string>("env", 'e', "Target environment", true));
        def.options.push_back(makeOption<std::string>("tag", std::nullopt, "Release tag", true));
        def.options.push_back(makeOption<bool>("force", 'f'));
        def.arguments.push_back(makeArgument<std::string>("service", "", true, std::nullopt, 0));
        registry.registerCommand(def);
    }

    ParsedArguments parse(const std::vector<std::string>& args) {
        CommandRouter router(registry);
        ParsedArguments parsed = router.parseArguments(args);
        router.bindToDefinition(*registry.tryGetCommand("deploy"), parsed);
        return parsed;
    }

    int run(const std::vector<std::string>& args, std::unique_ptr<IArgumentValidator> validator = nullptr) {
        CommandContext ctx(parse(args), args, {"deploy"}, registry.tryGetCommand("deploy"), sink);
        MiddlewarePipeline pipeline;
        pipeline.use(std::make_unique<ValidationMiddleware>(std::move(validator)));
        auto handler = pipeline.build([this](CommandContext&, const CancellationToken&) {
            ++commandRuns;
            return 0;
        });
        return handler(ctx, CancellationToken());
    }

    CommandRegistry registry;
    CapturingOutputSink sink;
    int commandRuns{0};
};

// Test: complete input passes through
TEST_F(ValidationMiddlewareTest, ValidInputReachesCommand) {
    EXPECT_EQ(run({"api", "--env=prod", "--tag=v1"}), 0);
    EXPECT_EQ(commandRuns, 1);
    EXPECT_TRUE(sink.errors.empty());
}

// Test: short spelling satisfies a required option
TEST_F(ValidationMiddlewareTest, ShortNameSatisfiesRequired) {
    EXPECT_EQ(run({"api", "-e", "prod", "--tag=v1"}), 0);
    EXPECT_EQ(commandRuns, 1);
}

// Test: missing required option stops the chain with exit code 1
TEST_F(ValidationMiddlewareTest, MissingRequiredOption) {
    EXPECT_EQ(run({"api", "--tag=v1"}), 1);
    EXPECT_EQ(commandRuns, 0);

    ASSERT_EQ(sink.errors.size(), 2u);
    EXPECT_EQ(sink.errors[0], "Validation errors:");
    EXPECT_EQ(sink.errors[1], "  - Required option '--env/-e' is missing.");
    EXPECT_TRUE(sink.lines.empty());
}

// Test: every error is reported, options without a short name shown long-only
TEST_F(ValidationMiddlewareTest, ReportsAllErrors) {
    EXPECT_EQ(run({}), 1);

    std::vector<std::string> expected{
        "Validation errors:",
        "  - Required option '--env/-e' is missing.",
        "  - Required option '--tag' is missing.",
        "  - Required argument 'service' is missing.",
    };
    EXPECT_EQ(sink.errors, expected);
}

// Test: custom validator replaces the default
TEST_F(ValidationMiddlewareTest, CustomValidator) {
    EXPECT_EQ(run({"api", "--env=prod", "--tag=v1"}, std::make_unique<RejectAllValidator>()), 1);
    EXPECT_EQ(commandRuns, 0);
    ASSERT_EQ(sink.errors.size(), 2u);
    EXPECT_EQ(sink.errors[1], "  - Always wrong.");
}

// Test: default validator names the offending parameter
TEST_F(ValidationMiddlewareTest, ValidatorParameterNames) {
    DefaultArgumentValidator validator;
    auto result = validator.validate(parse({"--env=x"}), *registry.tryGetCommand("deploy"));

    EXPECT_FALSE(result.isValid());
    ASSERT_EQ(result.errors().size(), 2u);
    EXPECT_EQ(result.errors()[0].parameterName, std::optional<std::string>("tag"));
    EXPECT_EQ(result.errors()[1].parameterName, std::optional<std::string>("service"));
    EXPECT_TRUE(ValidationResult::success().isValid());
}
