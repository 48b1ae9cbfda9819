#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/CommandDefinition.hpp"
#include "util/Expected.hpp"
#include "util/StringUtils.hpp"

namespace clicore {

/**
 * @brief Catalogue of command definitions keyed by name and alias
 *
 * Populated during configuration, then sealed and only read by the router
 * and help generator. Lookups are case-insensitive. Definitions keep their
 * address for the registry's lifetime, so pointers handed out stay valid.
 *
 * Every name and alias is unique across the whole registry. A parent is
 * not checked at registration; the router resolves it lazily.
 */
class CommandRegistry {
public:
    CommandRegistry() = default;
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;
    CommandRegistry(CommandRegistry&&) = default;
    CommandRegistry& operator=(CommandRegistry&&) = default;

    /**
     * @brief Adds a definition
     *
     * Validates the name, every alias and the option short names before
     * inserting anything, so a rejected definition leaves the registry
     * unchanged.
     *
     * @throws DuplicateNameError if the name or an alias is already taken
     * @throws ConfigurationError if the registry is sealed, the name is empty,
     *         or two options share a short name
     */
    const CommandDefinition& registerCommand(CommandDefinition definition);

    /// nullptr when no name or alias matches.
    const CommandDefinition* tryGetCommand(const std::string& name) const;
    Expected<const CommandDefinition*> getCommand(const std::string& name) const;

    /// Every definition once, in registration order.
    std::vector<const CommandDefinition*> commands() const;
    std::vector<const CommandDefinition*> rootCommands() const;
    /// Definitions whose parent path equals parentName (case-insensitive).
    std::vector<const CommandDefinition*> subcommands(const std::string& parentName) const;

    /// Rejects further registration; idempotent.
    void seal();
    bool sealed() const { return isSealed; }

    size_t size() const { return definitions.size(); }

private:
    std::vector<std::unique_ptr<CommandDefinition>> definitions;
    std::map<std::string, const CommandDefinition*, CaseInsensitiveLess> byName;
    bool isSealed{false};
};

}
