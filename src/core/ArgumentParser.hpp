#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/ParsedArguments.hpp"

namespace clicore {

/// Style switches for the tokenizer.
struct ParserOptions {
    bool allowWindowsStyle{false};          // "/name" and "/name value"
    bool allowCombinedShortOptions{true};   // "-abc" == "-a -b -c"
};

/**
 * @brief Tokenizes an argument vector following POSIX/GNU conventions
 *
 * Recognized forms:
 *   --name            flag
 *   --name=value      option with explicit value
 *   -n [value]        short option, takes the next token unless it is option-like
 *   -abc              combined short flags (when enabled)
 *   /name [value]     Windows style (when enabled)
 *   --                everything after it is positional
 *
 * Never throws: anything unrecognized becomes a positional argument.
 */
class ArgumentParser {
public:
    explicit ArgumentParser(ParserOptions options = ParserOptions{});

    ParsedArguments parse(const std::vector<std::string>& args) const;

    /// Starts with '-', or with '/' when Windows style is enabled.
    bool isOptionLike(const std::string& token) const;

    const ParserOptions& options() const { return opts; }

private:
    size_t parseLongOption(const std::vector<std::string>& args, size_t index, ParsedArguments& result) const;
    size_t parseShortOption(const std::vector<std::string>& args, size_t index, ParsedArguments& result) const;
    size_t parseWindowsOption(const std::vector<std::string>& args, size_t index, ParsedArguments& result) const;
    size_t consumeValue(const std::vector<std::string>& args, size_t index, const std::string& name, ParsedArguments& result) const;

    ParserOptions opts;
};

}
