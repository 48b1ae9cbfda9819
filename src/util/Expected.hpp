#pragma once

#include <optional>
#include <string>
#include <utility>

namespace clicore {

enum class ErrorCode {
    None = 0,
    CommandNotFound,
    TypeConversion
};

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * @brief Value or Error for operations whose failure is an ordinary outcome
 *
 * Used for lookups that may miss and conversions that may not parse;
 * configuration mistakes throw instead.
 */
template <typename T>
class Expected {
public:
    Expected(const T& value) : stored(value) {}
    Expected(T&& value) : stored(std::move(value)) {}
    Expected(const Error& err) : err(err) {}
    Expected(Error&& err) : err(std::move(err)) {}

    bool has_value() const { return stored.has_value(); }
    explicit operator bool() const { return stored.has_value(); }
    const T& value() const { return *stored; }
    T& value() { return *stored; }
    const Error& error() const { return err; }

    /// The value, or fallback when this holds an error.
    T valueOr(T fallback) const { return stored ? *stored : std::move(fallback); }

private:
    std::optional<T> stored;
    Error err{};
};

}
