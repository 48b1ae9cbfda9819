#include "middleware/MiddlewarePipeline.hpp"

#include <stdexcept>

namespace clicore {

namespace {

class FunctionMiddleware : public ICommandMiddleware {
public:
    explicit FunctionMiddleware(MiddlewareFunction fn) : fn(std::move(fn)) {}

    int invoke(CommandContext& ctx, const CommandHandler& next, const CancellationToken& token) override {
        return fn(ctx, next, token);
    }

private:
    MiddlewareFunction fn;
};

}

MiddlewarePipeline& MiddlewarePipeline::use(std::unique_ptr<ICommandMiddleware> middleware) {
    if (built) {
        throw std::logic_error("Middleware cannot be added after the pipeline has been built.");
    }
    if (!middleware) {
        throw std::invalid_argument("Middleware must not be null.");
    }
    middlewares.push_back(std::move(middleware));
    return *this;
}

MiddlewarePipeline& MiddlewarePipeline::use(MiddlewareFunction middleware) {
    if (!middleware) {
        throw std::invalid_argument("Middleware must not be empty.");
    }
    return use(std::make_unique<FunctionMiddleware>(std::move(middleware)));
}

CommandHandler MiddlewarePipeline::build(CommandHandler finalHandler) {
    built = true;
    CommandHandler pipeline = std::move(finalHandler);

    // Wrap from the innermost outwards so the first registered ends up outermost.
    for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
        ICommandMiddleware* middleware = it->get();
        CommandHandler next = std::move(pipeline);
        pipeline = [middleware, next](CommandContext& ctx, const CancellationToken& token) {
            return middleware->invoke(ctx, next, token);
        };
    }

    return pipeline;
}

}
