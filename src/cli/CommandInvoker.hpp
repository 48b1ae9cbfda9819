#pragma once

#include "cli/ICommand.hpp"

namespace clicore {

/// Innermost pipeline step: runs the command and traces the outcome.
class CommandInvoker {
public:
    int invoke(ICommand& cmd, CommandContext& ctx, const CancellationToken& token);
};

}
