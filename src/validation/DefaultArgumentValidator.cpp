#include "validation/DefaultArgumentValidator.hpp"

namespace clicore {

ValidationResult DefaultArgumentValidator::validate(const ParsedArguments& arguments, const CommandDefinition& definition) const {
    ValidationResult result;

    for (const auto& option : definition.options) {
        if (!option.required) continue;

        bool supplied = arguments.hasOption(option.name) ||
                        (option.shortName && arguments.hasOption(std::string(1, *option.shortName)));
        if (!supplied) {
            std::string display = option.shortName
                ? "--" + option.name + "/-" + std::string(1, *option.shortName)
                : "--" + option.name;
            result.addError("Required option '" + display + "' is missing.", option.name);
        }
    }

    for (const ArgumentDefinition* argument : definition.argumentsByPosition()) {
        if (argument->required && !arguments.hasNamedArgument(argument->name)) {
            result.addError("Required argument '" + argument->name + "' is missing.", argument->name);
        }
    }

    return result;
}

}
