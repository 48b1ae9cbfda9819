#pragma once

#include <string>
#include <vector>

#include "core/ArgumentParser.hpp"
#include "core/CommandRegistry.hpp"

namespace clicore {

/// Outcome of routing: command is nullptr when nothing matched.
struct CommandRoute {
    const CommandDefinition* command{nullptr};
    std::vector<std::string> commandPath;
    std::vector<std::string> remainingArgs;

    bool matched() const { return command != nullptr; }
};

/**
 * @brief Resolves the deepest command path named by the leading tokens
 *
 * Walks tokens left to right, matching each against the children of the
 * path consumed so far (registration order, first match wins), and stops
 * at the first option-like or unknown token.
 */
class CommandRouter {
public:
    explicit CommandRouter(const CommandRegistry& registry, ArgumentParser parser = ArgumentParser());

    CommandRoute route(const std::vector<std::string>& args) const;

    ParsedArguments parseArguments(const std::vector<std::string>& args) const;

    /**
     * @brief Applies a definition's metadata to freshly parsed arguments
     *
     * Binds positionals to ArgumentDefinitions by ascending position, and
     * copies values supplied under an option's short name onto its long
     * name so both spellings read the same.
     */
    void bindToDefinition(const CommandDefinition& definition, ParsedArguments& parsed) const;

    const ArgumentParser& parser() const { return argParser; }

private:
    const CommandRegistry& registry;
    ArgumentParser argParser;
};

}
