#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "middleware/ICommandMiddleware.hpp"

namespace clicore {

using MiddlewareFunction = std::function<int(CommandContext&, const CommandHandler&, const CancellationToken&)>;

/**
 * @brief Composes middleware around a final handler
 *
 * The first middleware registered is the outermost: it runs first on the
 * way in and last on the way out. Handlers returned by build() refer to the
 * pipeline's middleware and must not outlive it.
 */
class MiddlewarePipeline {
public:
    MiddlewarePipeline() = default;
    MiddlewarePipeline(MiddlewarePipeline&&) = default;
    MiddlewarePipeline& operator=(MiddlewarePipeline&&) = default;

    /// @throws std::logic_error once build() has been called
    MiddlewarePipeline& use(std::unique_ptr<ICommandMiddleware> middleware);
    MiddlewarePipeline& use(MiddlewareFunction middleware);

    CommandHandler build(CommandHandler finalHandler);

    size_t size() const { return middlewares.size(); }
    bool isBuilt() const { return built; }

private:
    std::vector<std::unique_ptr<ICommandMiddleware>> middlewares;
    bool built{false};
};

}
