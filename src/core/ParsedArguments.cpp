#include "core/ParsedArguments.hpp"

namespace clicore {

void ParsedArguments::addOption(const std::string& name) {
    options[name];
}

void ParsedArguments::addOption(const std::string& name, const std::string& value) {
    options[name].push_back(value);
}

void ParsedArguments::addPositional(const std::string& value) {
    positionals.push_back(value);
}

void ParsedArguments::addNamedArgument(const std::string& name, const std::string& value) {
    namedArguments[name] = value;
}

bool ParsedArguments::hasOption(const std::string& name) const {
    return options.find(name) != options.end();
}

std::optional<std::string> ParsedArguments::optionValue(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

const std::vector<std::string>& ParsedArguments::optionValues(const std::string& name) const {
    static const std::vector<std::string> empty;
    auto it = options.find(name);
    return it == options.end() ? empty : it->second;
}

std::vector<std::string> ParsedArguments::optionNames() const {
    std::vector<std::string> names;
    names.reserve(options.size());
    for (const auto& kv : options) names.push_back(kv.first);
    return names;
}

std::optional<std::string> ParsedArguments::positionalAt(size_t index) const {
    if (index >= positionals.size()) return std::nullopt;
    return positionals[index];
}

bool ParsedArguments::hasNamedArgument(const std::string& name) const {
    return namedArguments.find(name) != namedArguments.end();
}

std::optional<std::string> ParsedArguments::namedArgument(const std::string& name) const {
    auto it = namedArguments.find(name);
    if (it == namedArguments.end()) return std::nullopt;
    return it->second;
}

}
