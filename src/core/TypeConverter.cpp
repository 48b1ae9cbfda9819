#include "core/TypeConverter.hpp"

#include <charconv>
#include <cmath>
#include <locale>
#include <sstream>

namespace clicore::detail {

namespace {

// from_chars rejects a leading '+', which plain decimal input allows.
std::string stripPlus(const std::string& s) {
    if (s.size() > 1 && s[0] == '+' && s[1] != '-' && s[1] != '+') return s.substr(1);
    return s;
}

}

bool parseSigned(const std::string& raw, long long& out) {
    std::string text = stripPlus(trim(raw));
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out, 10);
    return ec == std::errc() && ptr == last;
}

bool parseUnsigned(const std::string& raw, unsigned long long& out) {
    std::string text = stripPlus(trim(raw));
    if (text.empty() || text[0] == '-') return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out, 10);
    return ec == std::errc() && ptr == last;
}

bool parseFloating(const std::string& raw, long double& out) {
    std::string text = trim(raw);
    if (text.empty()) return false;
    // Plain decimal only: no hex floats, inf or nan.
    for (char c : text) {
        bool allowed = (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
        if (!allowed) return false;
    }
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    long double value = 0;
    iss >> value;
    if (iss.fail()) return false;
    // The whole token must be consumed.
    if (iss.peek() != std::char_traits<char>::eof()) return false;
    if (!std::isfinite(value)) return false;
    out = value;
    return true;
}

std::string formatFloating(long double value, int digits) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.precision(digits);
    oss << value;
    return oss.str();
}

bool parseBoolean(const std::string& raw) {
    std::string v = toLower(trim(raw));
    if (v == "true") return true;
    if (v == "false") return false;
    return raw.empty() || v == "1" || v == "yes" || v == "on";
}

}
