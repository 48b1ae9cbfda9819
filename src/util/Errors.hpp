#pragma once

#include <stdexcept>
#include <string>

namespace clicore {

/**
 * @brief Raised while the command tree is being configured
 *
 * Configuration mistakes (conflicting short names, registering into a
 * sealed registry) are programming errors and surface immediately during
 * setup instead of during a run.
 */
class ConfigurationError : public std::logic_error {
public:
    explicit ConfigurationError(const std::string& message) : std::logic_error(message) {}
};

/// A command name or alias collides with one that is already registered.
class DuplicateNameError : public ConfigurationError {
public:
    explicit DuplicateNameError(const std::string& message) : ConfigurationError(message) {}
};

/// A raw token could not be converted into the requested value type.
class TypeConversionError : public std::runtime_error {
public:
    TypeConversionError(const std::string& raw, const std::string& typeName)
        : std::runtime_error("Cannot convert '" + raw + "' to " + typeName),
          rawValue(raw),
          target(typeName) {}

    const std::string& raw() const { return rawValue; }
    const std::string& targetType() const { return target; }

private:
    std::string rawValue;
    std::string target;
};

}
