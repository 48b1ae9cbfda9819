#pragma once

#include <any>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/OutputSink.hpp"
#include "core/CommandDefinition.hpp"
#include "core/ParsedArguments.hpp"
#include "core/TypeConverter.hpp"
#include "util/Expected.hpp"
#include "util/Logger.hpp"

namespace clicore {

/**
 * @brief Everything a command and its middleware see for one invocation
 *
 * Typed getters fall back in this order:
 *   1. the supplied value, converted
 *   2. for boolean targets, a present flag means true
 *   3. the default declared on the matching Option/ArgumentDefinition
 *   4. T{}
 * A supplied value that fails to convert falls through to 3.
 */
class CommandContext {
public:
    CommandContext(ParsedArguments arguments,
                   std::vector<std::string> rawArgs,
                   std::vector<std::string> commandPath,
                   const CommandDefinition* definition,
                   IOutputSink& output);

    const ParsedArguments& arguments() const { return args; }
    ParsedArguments& arguments() { return args; }
    const std::vector<std::string>& rawArgs() const { return raw; }
    /// Command path joined by spaces ("git remote add").
    const std::string& commandName() const { return name; }
    const std::vector<std::string>& commandPath() const { return path; }
    const CommandDefinition* definition() const { return def; }
    IOutputSink& output() const { return *sink; }

    /// Per-invocation values shared between middleware and the command.
    std::unordered_map<std::string, std::any>& items() { return bag; }
    const std::unordered_map<std::string, std::any>& items() const { return bag; }

    bool hasOption(const std::string& optionName) const { return args.hasOption(optionName); }

    template <typename T>
    T getOption(const std::string& optionName) const {
        if (auto rawValue = args.optionValue(optionName)) {
            Expected<T> parsed = parseValue<T>(*rawValue);
            if (parsed) return parsed.value();
            Logger::instance().debug("Option '" + optionName + "': " + parsed.error().message +
                                     ", using declared default");
        } else if constexpr (is_flag_type_v<T>) {
            if (args.hasOption(optionName)) return T{true};
        }
        const OptionDefinition* option = def ? def->findOption(optionName) : nullptr;
        return declaredDefault<T>(option ? option->defaultValue : std::nullopt);
    }

    template <typename T>
    T getArgument(const std::string& argumentName) const {
        if (auto rawValue = args.namedArgument(argumentName)) {
            Expected<T> parsed = parseValue<T>(*rawValue);
            if (parsed) return parsed.value();
            Logger::instance().debug("Argument '" + argumentName + "': " + parsed.error().message +
                                     ", using declared default");
        }
        const ArgumentDefinition* argument = def ? def->findArgument(argumentName) : nullptr;
        return declaredDefault<T>(argument ? argument->defaultValue : std::nullopt);
    }

    template <typename T>
    std::vector<T> getOptionValues(const std::string& optionName) const {
        return args.getOptionValues<T>(optionName);
    }

    template <typename T>
    bool tryGetValue(const std::string& optionName, T& out) const {
        return args.tryGetValue<T>(optionName, out);
    }

private:
    template <typename T>
    static T declaredDefault(const std::optional<std::string>& text) {
        if (!text) return T{};
        return parseValue<T>(*text).valueOr(T{});
    }

    ParsedArguments args;
    std::vector<std::string> raw;
    std::vector<std::string> path;
    std::string name;
    const CommandDefinition* def;
    IOutputSink* sink;
    std::unordered_map<std::string, std::any> bag;
};

}
