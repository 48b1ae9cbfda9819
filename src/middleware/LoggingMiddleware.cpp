#include "middleware/LoggingMiddleware.hpp"

#include <chrono>

namespace clicore {

int LoggingMiddleware::invoke(CommandContext& ctx, const CommandHandler& next, const CancellationToken& token) {
    const Logger& logger = Logger::instance();
    logger.log(level, "Starting '" + ctx.commandName() + "'");

    auto start = std::chrono::steady_clock::now();
    int exitCode = next(ctx, token);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    logger.log(level, "Finished '" + ctx.commandName() + "' with exit code " + std::to_string(exitCode) +
                      " in " + std::to_string(elapsed.count()) + " ms");
    return exitCode;
}

}
