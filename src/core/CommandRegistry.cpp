#include "core/CommandRegistry.hpp"

#include <set>

#include "util/Errors.hpp"
#include "util/Logger.hpp"

namespace clicore {

const CommandDefinition& CommandRegistry::registerCommand(CommandDefinition definition) {
    if (isSealed) {
        throw ConfigurationError("Cannot register command '" + definition.name + "': registry is sealed.");
    }
    if (definition.name.empty()) {
        throw ConfigurationError("Command name must not be empty.");
    }

    if (byName.count(definition.name)) {
        throw DuplicateNameError("Command '" + definition.name + "' is already registered.");
    }
    std::set<std::string, CaseInsensitiveLess> claimed{definition.name};
    for (const auto& alias : definition.aliases) {
        if (alias.empty()) {
            throw ConfigurationError("Command '" + definition.name + "' has an empty alias.");
        }
        if (byName.count(alias) || !claimed.insert(alias).second) {
            throw DuplicateNameError("Command alias '" + alias + "' is already registered.");
        }
    }

    std::set<std::string, CaseInsensitiveLess> shortNames;
    for (const auto& option : definition.options) {
        if (!option.shortName) continue;
        if (!shortNames.insert(std::string(1, *option.shortName)).second) {
            throw ConfigurationError("Command '" + definition.name + "' declares short option '-" +
                                     std::string(1, *option.shortName) + "' more than once.");
        }
    }

    definitions.push_back(std::make_unique<CommandDefinition>(std::move(definition)));
    const CommandDefinition* stored = definitions.back().get();
    byName[stored->name] = stored;
    for (const auto& alias : stored->aliases) {
        byName[alias] = stored;
    }

    Logger::instance().debug("Registered command: " + stored->qualifiedName());
    return *stored;
}

const CommandDefinition* CommandRegistry::tryGetCommand(const std::string& name) const {
    auto it = byName.find(name);
    return it == byName.end() ? nullptr : it->second;
}

Expected<const CommandDefinition*> CommandRegistry::getCommand(const std::string& name) const {
    const CommandDefinition* def = tryGetCommand(name);
    if (!def) return Error{ErrorCode::CommandNotFound, "Command '" + name + "' not found."};
    return def;
}

std::vector<const CommandDefinition*> CommandRegistry::commands() const {
    std::vector<const CommandDefinition*> out;
    out.reserve(definitions.size());
    for (const auto& def : definitions) out.push_back(def.get());
    return out;
}

std::vector<const CommandDefinition*> CommandRegistry::rootCommands() const {
    std::vector<const CommandDefinition*> out;
    for (const auto& def : definitions) {
        if (def->isRoot()) out.push_back(def.get());
    }
    return out;
}

std::vector<const CommandDefinition*> CommandRegistry::subcommands(const std::string& parentName) const {
    std::vector<const CommandDefinition*> out;
    for (const auto& def : definitions) {
        if (!def->isRoot() && iequals(def->parent, parentName)) out.push_back(def.get());
    }
    return out;
}

void CommandRegistry::seal() {
    isSealed = true;
}

}
