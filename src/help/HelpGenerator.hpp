#pragma once

#include <string>
#include <vector>

#include "cli/OutputSink.hpp"
#include "core/CommandRegistry.hpp"

namespace clicore {

/**
 * @brief Renders usage text from the registered definitions
 *
 * Pure rendering: reads the registry, writes to the sink, changes nothing.
 * Hidden commands are left out of every listing.
 */
class HelpGenerator {
public:
    HelpGenerator(const CommandRegistry& registry, IOutputSink& output);

    /// Root commands with their children indented below them.
    void renderGlobalHelp() const;

    /// Group help when the command has children, leaf help otherwise.
    void renderCommandHelp(const CommandDefinition& command, const std::vector<std::string>& commandPath) const;

private:
    void renderCommandTree(const std::string& parentPath, size_t level) const;
    void renderGroupHelp(const CommandDefinition& command, const std::string& fullName,
                         const std::vector<const CommandDefinition*>& children) const;
    void renderLeafHelp(const CommandDefinition& command, const std::string& fullName) const;
    void renderHelpOptionLine(size_t width) const;

    std::vector<const CommandDefinition*> visibleChildren(const std::string& parentPath) const;

    const CommandRegistry& registry;
    IOutputSink& output;
};

}
