#include "core/ValueType.hpp"

namespace clicore {

std::string ValueType::name() const {
    switch (kind) {
        case ValueKind::String: return "string";
        case ValueKind::Integer: return "int";
        case ValueKind::Int64: return "long";
        case ValueKind::Float: return "float";
        case ValueKind::Double: return "double";
        case ValueKind::Decimal: return "decimal";
        case ValueKind::Boolean: return "bool";
        case ValueKind::Enumeration: return enumName.empty() ? std::string("enum") : enumName;
    }
    return "string";
}

}
