#pragma once

#include "middleware/ICommandMiddleware.hpp"
#include "util/Logger.hpp"

namespace clicore {

/// Logs command start, exit code and elapsed time; never short-circuits.
class LoggingMiddleware : public ICommandMiddleware {
public:
    explicit LoggingMiddleware(LogLevel level = LogLevel::Info) : level(level) {}

    int invoke(CommandContext& ctx, const CommandHandler& next, const CancellationToken& token) override;

private:
    LogLevel level;
};

}
