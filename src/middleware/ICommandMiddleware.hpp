#pragma once

#include <functional>

#include "cli/CancellationToken.hpp"
#include "cli/CommandContext.hpp"

namespace clicore {

using CommandHandler = std::function<int(CommandContext&, const CancellationToken&)>;

/**
 * @brief One layer of the execution onion
 *
 * Either calls next (before and/or after doing its own work) or returns an
 * exit code without calling it to short-circuit the rest of the chain.
 */
class ICommandMiddleware {
public:
    virtual ~ICommandMiddleware() = default;
    virtual int invoke(CommandContext& ctx, const CommandHandler& next, const CancellationToken& token) = 0;
};

}
