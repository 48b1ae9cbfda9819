#pragma once

#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/ValueType.hpp"
#include "util/Errors.hpp"
#include "util/Expected.hpp"
#include "util/StringUtils.hpp"

namespace clicore {

/**
 * @brief Name table for an enumeration usable as an option or argument type
 *
 * Specialize for each enum that commands read through the typed getters:
 *
 *   template <> struct EnumNames<Color> {
 *       static const char* typeName() { return "Color"; }
 *       static const std::vector<std::pair<std::string, Color>>& entries();
 *   };
 *
 * Names are matched case-insensitively.
 */
template <typename E>
struct EnumNames {
    static_assert(sizeof(E) == 0, "specialize clicore::EnumNames<E> to convert this enum");
};

namespace detail {

// Locale-independent parsers; return false when the trimmed token is not a
// complete number of the requested family.
bool parseSigned(const std::string& raw, long long& out);
bool parseUnsigned(const std::string& raw, unsigned long long& out);
bool parseFloating(const std::string& raw, long double& out);
std::string formatFloating(long double value, int digits);

// Strict "true"/"false" first, then the flag-presence fallback.
bool parseBoolean(const std::string& raw);

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

}

/// True for target types where a bare flag means "true".
template <typename T>
inline constexpr bool is_flag_type_v = std::is_same_v<T, bool> || std::is_same_v<T, std::optional<bool>>;

/**
 * @brief Conversion case for one value type
 *
 * Each specialization provides:
 *   static T parse(const std::string& raw);       // throws TypeConversionError
 *   static std::string format(const T& value);     // textual form used for defaults
 *   static ValueType type();                       // descriptor for help output
 */
template <typename T, typename Enable = void>
struct Converter;

template <>
struct Converter<std::string> {
    static std::string parse(const std::string& raw) { return raw; }
    static std::string format(const std::string& value) { return value; }
    static ValueType type() { return ValueType{ValueKind::String, {}}; }
};

template <>
struct Converter<bool> {
    static bool parse(const std::string& raw) { return detail::parseBoolean(raw); }
    static std::string format(bool value) { return value ? "true" : "false"; }
    static ValueType type() { return ValueType{ValueKind::Boolean, {}}; }
};

template <typename T>
struct Converter<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static T parse(const std::string& raw) {
        if constexpr (std::is_signed_v<T>) {
            long long v = 0;
            if (!detail::parseSigned(raw, v) ||
                v < static_cast<long long>(std::numeric_limits<T>::min()) ||
                v > static_cast<long long>(std::numeric_limits<T>::max())) {
                throw TypeConversionError(raw, type().name());
            }
            return static_cast<T>(v);
        } else {
            unsigned long long v = 0;
            if (!detail::parseUnsigned(raw, v) ||
                v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
                throw TypeConversionError(raw, type().name());
            }
            return static_cast<T>(v);
        }
    }
    static std::string format(T value) { return std::to_string(value); }
    static ValueType type() {
        return ValueType{sizeof(T) > sizeof(int) ? ValueKind::Int64 : ValueKind::Integer, {}};
    }
};

template <typename T>
struct Converter<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static T parse(const std::string& raw) {
        long double v = 0;
        if (!detail::parseFloating(raw, v) ||
            v < -static_cast<long double>(std::numeric_limits<T>::max()) ||
            v > static_cast<long double>(std::numeric_limits<T>::max())) {
            throw TypeConversionError(raw, type().name());
        }
        return static_cast<T>(v);
    }
    static std::string format(T value) {
        return detail::formatFloating(value, std::numeric_limits<T>::digits10);
    }
    static ValueType type() {
        if constexpr (std::is_same_v<T, float>) return ValueType{ValueKind::Float, {}};
        else if constexpr (std::is_same_v<T, double>) return ValueType{ValueKind::Double, {}};
        else return ValueType{ValueKind::Decimal, {}};
    }
};

template <typename T>
struct Converter<T, std::enable_if_t<std::is_enum_v<T>>> {
    static T parse(const std::string& raw) {
        std::string key = trim(raw);
        for (const auto& [name, value] : EnumNames<T>::entries()) {
            if (iequals(name, key)) return value;
        }
        // Numeric form names a declared member by its underlying value.
        long long number = 0;
        if (detail::parseSigned(key, number)) {
            for (const auto& entry : EnumNames<T>::entries()) {
                if (static_cast<long long>(entry.second) == number) return entry.second;
            }
        }
        throw TypeConversionError(raw, EnumNames<T>::typeName());
    }
    static std::string format(T value) {
        for (const auto& [name, v] : EnumNames<T>::entries()) {
            if (v == value) return name;
        }
        return std::to_string(static_cast<std::underlying_type_t<T>>(value));
    }
    static ValueType type() { return ValueType{ValueKind::Enumeration, EnumNames<T>::typeName()}; }
};

// Optional targets convert like their underlying type; absence is the caller's business.
template <typename T>
struct Converter<std::optional<T>> {
    static std::optional<T> parse(const std::string& raw) { return Converter<T>::parse(raw); }
    static std::string format(const std::optional<T>& value) {
        return value ? Converter<T>::format(*value) : std::string();
    }
    static ValueType type() { return Converter<T>::type(); }
};

/// Converts a raw token; throws TypeConversionError when it cannot be parsed.
template <typename T>
T convert(const std::string& raw) {
    return Converter<T>::parse(raw);
}

/// Non-throwing variant of convert; the error carries the conversion message.
template <typename T>
Expected<T> parseValue(const std::string& raw) {
    try {
        return Converter<T>::parse(raw);
    } catch (const TypeConversionError& e) {
        return Error{ErrorCode::TypeConversion, e.what()};
    }
}

template <typename T>
bool tryConvert(const std::string& raw, T& out) {
    Expected<T> parsed = parseValue<T>(raw);
    if (!parsed) return false;
    out = std::move(parsed.value());
    return true;
}

template <typename T>
std::string formatValue(const T& value) {
    return Converter<T>::format(value);
}

template <typename T>
ValueType valueTypeOf() {
    return Converter<T>::type();
}

}
