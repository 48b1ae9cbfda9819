#pragma once

#include "validation/IArgumentValidator.hpp"

namespace clicore {

/// Checks that every required option and required argument was supplied.
class DefaultArgumentValidator : public IArgumentValidator {
public:
    ValidationResult validate(const ParsedArguments& arguments, const CommandDefinition& definition) const override;
};

}
