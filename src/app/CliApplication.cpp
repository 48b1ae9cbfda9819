#include "app/CliApplication.hpp"

#include <exception>
#include <stdexcept>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace clicore {

CliApplication::CliApplication(CommandRegistry registry,
                               CommandFactory factory,
                               MiddlewarePipeline pipeline,
                               std::unique_ptr<IOutputSink> output,
                               ParserOptions parserOptions)
    : commandRegistry(std::move(registry)),
      factory(std::move(factory)),
      pipeline(std::move(pipeline)),
      sink(output ? std::move(output) : std::make_unique<ConsoleOutputSink>()),
      router(commandRegistry, ArgumentParser(parserOptions)),
      help(commandRegistry, *sink) {}

int CliApplication::run(const std::vector<std::string>& args, const CancellationToken& token) {
    try {
        return dispatch(args, token);
    } catch (const std::exception& e) {
        Logger::instance().debug(std::string("Unhandled error: ") + e.what());
        sink->writeError(std::string("Error: ") + e.what());
        return Constants::EXIT_FAILURE_CODE;
    } catch (...) {
        Logger::instance().debug("Unhandled non-standard exception");
        sink->writeError("Error: unknown error");
        return Constants::EXIT_FAILURE_CODE;
    }
}

int CliApplication::run(int argc, const char* const* argv, const CancellationToken& token) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args, token);
}

int CliApplication::dispatch(const std::vector<std::string>& args, const CancellationToken& token) {
    commandRegistry.seal();

    if (!args.empty() && (args.front() == "--help" || args.front() == "-h")) {
        help.renderGlobalHelp();
        return Constants::EXIT_OK;
    }

    CommandRoute route = router.route(args);
    if (!route.matched()) {
        sink->writeError("No command specified. Use --help for available commands.");
        return Constants::EXIT_FAILURE_CODE;
    }

    ParsedArguments parsed = router.parseArguments(route.remainingArgs);
    router.bindToDefinition(*route.command, parsed);

    bool helpRequested = parsed.hasOption(Constants::HELP_LONG) || parsed.hasOption(Constants::HELP_SHORT);
    if (helpRequested && !route.command->disableHelp) {
        help.renderCommandHelp(*route.command, route.commandPath);
        return Constants::EXIT_OK;
    }

    CommandContext ctx(std::move(parsed), args, route.commandPath, route.command, *sink);

    if (!handler) {
        handler = pipeline.build([this](CommandContext& c, const CancellationToken& t) {
            return executeCommand(c, t);
        });
    }
    return handler(ctx, token);
}

int CliApplication::executeCommand(CommandContext& ctx, const CancellationToken& token) {
    const CommandDefinition* def = ctx.definition();
    std::unique_ptr<ICommand> command = factory.create(def->commandType);
    if (!command) {
        throw std::runtime_error("No command implementation registered for '" + ctx.commandName() + "'.");
    }
    return invoker.invoke(*command, ctx, token);
}

}
