#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/CommandDefinition.hpp"
#include "core/ParsedArguments.hpp"

namespace clicore {

struct ValidationError {
    std::string message;
    std::optional<std::string> parameterName;
};

class ValidationResult {
public:
    bool isValid() const { return errorList.empty(); }
    const std::vector<ValidationError>& errors() const { return errorList; }

    void addError(const std::string& message, std::optional<std::string> parameterName = std::nullopt) {
        errorList.push_back(ValidationError{message, std::move(parameterName)});
    }

    static ValidationResult success() { return {}; }

private:
    std::vector<ValidationError> errorList;
};

class IArgumentValidator {
public:
    virtual ~IArgumentValidator() = default;
    virtual ValidationResult validate(const ParsedArguments& arguments, const CommandDefinition& definition) const = 0;
};

}
