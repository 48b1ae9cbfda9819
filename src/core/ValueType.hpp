#pragma once

#include <string>

namespace clicore {

enum class ValueKind { String, Integer, Int64, Float, Double, Decimal, Boolean, Enumeration };

/**
 * @brief Descriptor of the value type declared for an option or argument
 *
 * Closed set of kinds the converter supports. Enumerations carry the
 * display name given by their EnumNames specialization.
 */
struct ValueType {
    ValueKind kind{ValueKind::String};
    std::string enumName;

    bool isString() const { return kind == ValueKind::String; }
    bool isBoolean() const { return kind == ValueKind::Boolean; }

    /// Short display name used in help output ("int", "double", "bool", enum name...).
    std::string name() const;

    bool operator==(const ValueType& other) const { return kind == other.kind && enumName == other.enumName; }
    bool operator!=(const ValueType& other) const { return !(*this == other); }
};

}
