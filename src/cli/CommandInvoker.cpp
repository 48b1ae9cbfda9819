#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace clicore {

int CommandInvoker::invoke(ICommand& cmd, CommandContext& ctx, const CancellationToken& token) {
    Logger::instance().debug("Executing command: " + ctx.commandName());
    int exitCode = cmd.execute(ctx, token);
    if (exitCode != 0) {
        Logger::instance().debug(ctx.commandName() + ": exited with code " + std::to_string(exitCode));
    }
    return exitCode;
}

}
