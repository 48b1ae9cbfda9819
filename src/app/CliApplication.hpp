#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cli/CancellationToken.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/OutputSink.hpp"
#include "core/CommandRegistry.hpp"
#include "core/CommandRouter.hpp"
#include "help/HelpGenerator.hpp"
#include "middleware/MiddlewarePipeline.hpp"

namespace clicore {

/**
 * @brief Runs one argument vector through routing, parsing, help and the pipeline
 *
 * Owns the registry, factory and pipeline it is given. The registry is
 * sealed on the first run. Exit codes: 0 success, 1 when no command
 * matched, validation failed or anything threw; otherwise the command's
 * own exit code.
 */
class CliApplication {
public:
    CliApplication(CommandRegistry registry,
                   CommandFactory factory,
                   MiddlewarePipeline pipeline = MiddlewarePipeline(),
                   std::unique_ptr<IOutputSink> output = nullptr,
                   ParserOptions parserOptions = ParserOptions{});

    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    int run(const std::vector<std::string>& args, const CancellationToken& token = CancellationToken());

    /// Convenience for main(): skips argv[0].
    int run(int argc, const char* const* argv, const CancellationToken& token = CancellationToken());

    const CommandRegistry& registry() const { return commandRegistry; }
    IOutputSink& output() const { return *sink; }

private:
    int dispatch(const std::vector<std::string>& args, const CancellationToken& token);
    int executeCommand(CommandContext& ctx, const CancellationToken& token);

    CommandRegistry commandRegistry;
    CommandFactory factory;
    MiddlewarePipeline pipeline;
    std::unique_ptr<IOutputSink> sink;
    CommandRouter router;
    HelpGenerator help;
    CommandInvoker invoker;
    CommandHandler handler;
};

}
