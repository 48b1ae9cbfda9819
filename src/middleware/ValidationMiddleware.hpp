#pragma once

#include <memory>

#include "middleware/ICommandMiddleware.hpp"
#include "validation/IArgumentValidator.hpp"

namespace clicore {

/**
 * @brief Rejects invocations whose arguments fail validation
 *
 * Writes "Validation errors:" and one "  - <message>" line per error to the
 * error sink and returns 1 without calling the rest of the chain.
 */
class ValidationMiddleware : public ICommandMiddleware {
public:
    /// Uses DefaultArgumentValidator when validator is null.
    explicit ValidationMiddleware(std::unique_ptr<IArgumentValidator> validator = nullptr);

    int invoke(CommandContext& ctx, const CommandHandler& next, const CancellationToken& token) override;

private:
    std::unique_ptr<IArgumentValidator> validator;
};

}
