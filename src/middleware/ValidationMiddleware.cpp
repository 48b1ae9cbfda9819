#include "middleware/ValidationMiddleware.hpp"

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "validation/DefaultArgumentValidator.hpp"

namespace clicore {

ValidationMiddleware::ValidationMiddleware(std::unique_ptr<IArgumentValidator> validator)
    : validator(std::move(validator)) {
    if (!this->validator) {
        this->validator = std::make_unique<DefaultArgumentValidator>();
    }
}

int ValidationMiddleware::invoke(CommandContext& ctx, const CommandHandler& next, const CancellationToken& token) {
    if (const CommandDefinition* def = ctx.definition()) {
        ValidationResult result = validator->validate(ctx.arguments(), *def);
        if (!result.isValid()) {
            Logger::instance().debug(ctx.commandName() + ": " + std::to_string(result.errors().size()) +
                                     " validation error(s)");
            ctx.output().writeError("Validation errors:");
            for (const auto& error : result.errors()) {
                ctx.output().writeError("  - " + error.message);
            }
            return Constants::EXIT_FAILURE_CODE;
        }
    }
    return next(ctx, token);
}

}
