#include "core/CommandDefinition.hpp"

#include <algorithm>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace clicore {

std::string OptionDefinition::displayName() const {
    if (shortName) return std::string("-") + *shortName + ", --" + name;
    return "--" + name;
}

bool CommandDefinition::matches(const std::string& token) const {
    if (iequals(name, token)) return true;
    return std::any_of(aliases.begin(), aliases.end(),
        [&](const std::string& alias) { return iequals(alias, token); });
}

std::string CommandDefinition::qualifiedName() const {
    if (parent.empty()) return name;
    return parent + Constants::PARENT_PATH_SEPARATOR + name;
}

const OptionDefinition* CommandDefinition::findOption(const std::string& optionName) const {
    for (const auto& option : options) {
        if (iequals(option.name, optionName)) return &option;
    }
    if (optionName.size() == 1) {
        for (const auto& option : options) {
            if (option.shortName && iequals(std::string(1, *option.shortName), optionName)) return &option;
        }
    }
    return nullptr;
}

const ArgumentDefinition* CommandDefinition::findArgument(const std::string& argumentName) const {
    for (const auto& argument : arguments) {
        if (iequals(argument.name, argumentName)) return &argument;
    }
    return nullptr;
}

std::vector<const ArgumentDefinition*> CommandDefinition::argumentsByPosition() const {
    std::vector<const ArgumentDefinition*> ordered;
    ordered.reserve(arguments.size());
    for (const auto& argument : arguments) ordered.push_back(&argument);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const ArgumentDefinition* a, const ArgumentDefinition* b) { return a->position < b->position; });
    return ordered;
}

}
