#pragma once

#include <string>
#include <vector>

namespace clicore {

/**
 * @brief Small ASCII string helpers shared by the parser, registry and help output
 *
 * Command names, aliases and option names are compared case-insensitively
 * using plain ASCII folding so results never depend on the global locale.
 */

std::string toLower(const std::string& s);
std::string trim(const std::string& s);
bool iequals(const std::string& a, const std::string& b);
bool startsWith(const std::string& s, const std::string& prefix);

/// Pads with spaces up to width; longer strings are returned unchanged.
std::string padRight(const std::string& s, size_t width);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

/// Strict-weak ordering for case-insensitive map keys.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

}
