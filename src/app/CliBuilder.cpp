#include "app/CliBuilder.hpp"

#include "middleware/LoggingMiddleware.hpp"
#include "middleware/ValidationMiddleware.hpp"

namespace clicore {

CommandBuilder& CommandBuilder::addOption(const std::string& name,
                                          std::optional<char> shortName,
                                          const std::string& description,
                                          bool required,
                                          const std::optional<std::string>& defaultValue) {
    return addOption<std::string>(name, shortName, description, required, defaultValue);
}

CommandBuilder& CommandBuilder::addArgument(const std::string& name,
                                            const std::string& description,
                                            bool required,
                                            const std::optional<std::string>& defaultValue) {
    return addArgument<std::string>(name, description, required, defaultValue);
}

CommandBuilder& CommandBuilder::withAliases(std::vector<std::string> aliases) {
    def->aliases = std::move(aliases);
    return *this;
}

CommandBuilder& CommandBuilder::withoutHelp() {
    def->disableHelp = true;
    return *this;
}

CommandBuilder& CommandBuilder::hidden() {
    def->hidden = true;
    return *this;
}

CliBuilder& CliBuilder::useMiddleware(std::unique_ptr<ICommandMiddleware> middleware) {
    pipeline.use(std::move(middleware));
    return *this;
}

CliBuilder& CliBuilder::useMiddleware(MiddlewareFunction middleware) {
    pipeline.use(std::move(middleware));
    return *this;
}

CliBuilder& CliBuilder::useValidation() {
    pipeline.use(std::make_unique<ValidationMiddleware>());
    return *this;
}

CliBuilder& CliBuilder::useLogging(LogLevel level) {
    pipeline.use(std::make_unique<LoggingMiddleware>(level));
    return *this;
}

CliBuilder& CliBuilder::withParserOptions(ParserOptions options) {
    parserOptions = options;
    return *this;
}

CliBuilder& CliBuilder::withOutput(std::unique_ptr<IOutputSink> sink) {
    output = std::move(sink);
    return *this;
}

std::unique_ptr<CliApplication> CliBuilder::build() {
    CommandRegistry registry;
    for (auto& def : pending) {
        registry.registerCommand(std::move(*def));
    }
    pending.clear();

    return std::make_unique<CliApplication>(std::move(registry), std::move(factory), std::move(pipeline),
                                            std::move(output), parserOptions);
}

}
