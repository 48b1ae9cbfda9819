#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/TypeConverter.hpp"
#include "core/ValueType.hpp"

namespace clicore {

/**
 * @brief Metadata for a named option ("--name" / "-n")
 *
 * The default value is kept in textual form and converted on demand with
 * the same rules as a supplied value, so any typed getter can read it.
 */
struct OptionDefinition {
    std::string name;                          // long form, without "--"
    std::optional<char> shortName;             // without "-"
    std::string description;
    bool required{false};
    ValueType valueType{};
    std::optional<std::string> defaultValue;
    bool hasValue{true};                       // false for flag-only options
    bool allowMultiple{false};

    /// "-n, --name" or "--name"
    std::string displayName() const;
};

/// Metadata for a positional argument bound by position.
struct ArgumentDefinition {
    std::string name;
    std::string description;
    ValueType valueType{};
    bool required{false};
    std::optional<std::string> defaultValue;
    int position{0};
};

/**
 * @brief Metadata for one command of the command tree
 *
 * Nested commands name their parent by its dotted path: a command "add"
 * under "git remote" has parent "git.remote". commandType is the opaque
 * handle the CommandFactory resolves to an ICommand instance.
 */
struct CommandDefinition {
    std::string name;
    std::string description;
    std::vector<std::string> aliases;
    std::string parent;
    std::string commandType;
    std::vector<OptionDefinition> options;
    std::vector<ArgumentDefinition> arguments;
    bool disableHelp{false};
    bool hidden{false};

    /// Case-insensitive match against the name or any alias.
    bool matches(const std::string& token) const;

    /// Dotted path of this command ("git.remote" for remote under git).
    std::string qualifiedName() const;

    bool isRoot() const { return parent.empty(); }

    /// Looks up by long name, or by short name when name is one character.
    const OptionDefinition* findOption(const std::string& optionName) const;
    const ArgumentDefinition* findArgument(const std::string& argumentName) const;

    std::vector<const ArgumentDefinition*> argumentsByPosition() const;
};

template <typename T>
OptionDefinition makeOption(const std::string& name,
                            std::optional<char> shortName = std::nullopt,
                            const std::string& description = "",
                            bool required = false,
                            const std::optional<T>& defaultValue = std::nullopt) {
    OptionDefinition option;
    option.name = name;
    option.shortName = shortName;
    option.description = description;
    option.required = required;
    option.valueType = valueTypeOf<T>();
    option.hasValue = !is_flag_type_v<T>;
    if (defaultValue) option.defaultValue = formatValue<T>(*defaultValue);
    return option;
}

template <typename T>
ArgumentDefinition makeArgument(const std::string& name,
                                const std::string& description = "",
                                bool required = false,
                                const std::optional<T>& defaultValue = std::nullopt,
                                int position = 0) {
    ArgumentDefinition argument;
    argument.name = name;
    argument.description = description;
    argument.required = required;
    argument.valueType = valueTypeOf<T>();
    argument.position = position;
    if (defaultValue) argument.defaultValue = formatValue<T>(*defaultValue);
    return argument;
}

}
