#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/TypeConverter.hpp"
#include "util/StringUtils.hpp"

namespace clicore {

/**
 * @brief Result of tokenizing one argument vector
 *
 * Holds options (name -> raw values, repeated options append, names are
 * case-insensitive), positional tokens in order, and arguments the router
 * bound to their declared names. A flag option is present with an empty
 * value list.
 */
class ParsedArguments {
public:
    /// Records a flag occurrence (no value); keeps any values already recorded.
    void addOption(const std::string& name);
    void addOption(const std::string& name, const std::string& value);
    void addPositional(const std::string& value);
    void addNamedArgument(const std::string& name, const std::string& value);

    bool hasOption(const std::string& name) const;
    /// First value of the option, nullopt when absent or value-less.
    std::optional<std::string> optionValue(const std::string& name) const;
    const std::vector<std::string>& optionValues(const std::string& name) const;
    std::vector<std::string> optionNames() const;

    const std::vector<std::string>& positional() const { return positionals; }
    std::optional<std::string> positionalAt(size_t index) const;

    bool hasNamedArgument(const std::string& name) const;
    std::optional<std::string> namedArgument(const std::string& name) const;

    /// Strict accessor: false when the option is absent, value-less or unparsable.
    template <typename T>
    bool tryGetValue(const std::string& name, T& out) const {
        auto raw = optionValue(name);
        if (!raw) return false;
        return tryConvert<T>(*raw, out);
    }

    /**
     * @brief Typed option value with a caller-supplied fallback
     *
     * Boolean targets treat a present flag as true. Unparsable values
     * yield defaultValue.
     */
    template <typename T>
    T getOption(const std::string& name, const T& defaultValue = T{}) const {
        if constexpr (is_flag_type_v<T>) {
            if (!hasOption(name)) return defaultValue;
            auto raw = optionValue(name);
            if (!raw || raw->empty()) return T{true};
            T value{};
            return tryConvert<T>(*raw, value) ? value : defaultValue;
        } else {
            T value{};
            return tryGetValue<T>(name, value) ? value : defaultValue;
        }
    }

    /// Every value of a repeated option, unparsable ones skipped.
    template <typename T>
    std::vector<T> getOptionValues(const std::string& name) const {
        std::vector<T> result;
        for (const auto& raw : optionValues(name)) {
            T value{};
            if (tryConvert<T>(raw, value)) result.push_back(std::move(value));
        }
        return result;
    }

private:
    std::map<std::string, std::vector<std::string>, CaseInsensitiveLess> options;
    std::vector<std::string> positionals;
    std::map<std::string, std::string, CaseInsensitiveLess> namedArguments;
};

}
