#pragma once

#include "cli/CancellationToken.hpp"
#include "cli/CommandContext.hpp"

namespace clicore {

/// Executable behavior behind a command definition; returns the process exit code.
class ICommand {
public:
    virtual ~ICommand() = default;
    virtual int execute(CommandContext& ctx, const CancellationToken& token) = 0;
};

}
