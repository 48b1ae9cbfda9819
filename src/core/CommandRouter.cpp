#include "core/CommandRouter.hpp"

#include <algorithm>
#include <cstddef>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace clicore {

CommandRouter::CommandRouter(const CommandRegistry& registry, ArgumentParser parser)
    : registry(registry), argParser(std::move(parser)) {}

CommandRoute CommandRouter::route(const std::vector<std::string>& args) const {
    CommandRoute result;
    const std::vector<const CommandDefinition*> candidates = registry.commands();
    std::string parentPath;
    size_t cursor = 0;

    while (cursor < args.size()) {
        const std::string& token = args[cursor];
        if (argParser.isOptionLike(token)) break;

        auto it = std::find_if(candidates.begin(), candidates.end(), [&](const CommandDefinition* cmd) {
            return cmd->matches(token) && iequals(cmd->parent, parentPath);
        });
        if (it == candidates.end()) break;

        result.command = *it;
        result.commandPath.push_back((*it)->name);
        parentPath = (*it)->qualifiedName();
        ++cursor;
    }

    result.remainingArgs.assign(args.begin() + static_cast<std::ptrdiff_t>(cursor), args.end());

    if (result.matched()) {
        Logger::instance().debug("Routed to '" + join(result.commandPath, " ") + "' with " +
                                 std::to_string(result.remainingArgs.size()) + " remaining argument(s)");
    } else {
        Logger::instance().debug("No command matched the leading arguments");
    }
    return result;
}

ParsedArguments CommandRouter::parseArguments(const std::vector<std::string>& args) const {
    return argParser.parse(args);
}

void CommandRouter::bindToDefinition(const CommandDefinition& definition, ParsedArguments& parsed) const {
    const auto ordered = definition.argumentsByPosition();
    const auto& positional = parsed.positional();
    for (size_t i = 0; i < std::min(ordered.size(), positional.size()); ++i) {
        parsed.addNamedArgument(ordered[i]->name, positional[i]);
    }

    for (const auto& option : definition.options) {
        if (!option.shortName) continue;
        const std::string shortName(1, *option.shortName);
        // A one-letter long name equal to the short name is already the same entry.
        if (iequals(option.name, shortName) || !parsed.hasOption(shortName)) continue;

        const std::vector<std::string> values = parsed.optionValues(shortName);
        if (values.empty()) {
            parsed.addOption(option.name);
        }
        for (const auto& value : values) {
            parsed.addOption(option.name, value);
        }
    }
}

}
