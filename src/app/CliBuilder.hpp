#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/CliApplication.hpp"
#include "core/CommandDefinition.hpp"
#include "middleware/ICommandMiddleware.hpp"
#include "util/Logger.hpp"

namespace clicore {

class CliBuilder;

/**
 * @brief Fluent configuration of one command definition
 *
 * Valid until CliBuilder::build() runs; the definition is registered then.
 */
class CommandBuilder {
public:
    template <typename T>
    CommandBuilder& addOption(const std::string& name,
                              std::optional<char> shortName = std::nullopt,
                              const std::string& description = "",
                              bool required = false,
                              const std::optional<T>& defaultValue = std::nullopt) {
        def->options.push_back(makeOption<T>(name, shortName, description, required, defaultValue));
        return *this;
    }

    /// String-valued option.
    CommandBuilder& addOption(const std::string& name,
                              std::optional<char> shortName = std::nullopt,
                              const std::string& description = "",
                              bool required = false,
                              const std::optional<std::string>& defaultValue = std::nullopt);

    /// Repeatable option; every occurrence is kept.
    template <typename T>
    CommandBuilder& addMultiOption(const std::string& name,
                                   std::optional<char> shortName = std::nullopt,
                                   const std::string& description = "") {
        OptionDefinition option = makeOption<T>(name, shortName, description);
        option.allowMultiple = true;
        def->options.push_back(std::move(option));
        return *this;
    }

    /// Positional argument; its position is the number of arguments declared before it.
    template <typename T>
    CommandBuilder& addArgument(const std::string& name,
                                const std::string& description = "",
                                bool required = false,
                                const std::optional<T>& defaultValue = std::nullopt) {
        def->arguments.push_back(makeArgument<T>(name, description, required, defaultValue,
                                                 static_cast<int>(def->arguments.size())));
        return *this;
    }

    CommandBuilder& addArgument(const std::string& name,
                                const std::string& description = "",
                                bool required = false,
                                const std::optional<std::string>& defaultValue = std::nullopt);

    /// Child command whose parent is this command's dotted path.
    template <typename TCommand>
    CommandBuilder addCommand(const std::string& name, const std::string& description = "");

    CommandBuilder& withAliases(std::vector<std::string> aliases);

    /// The command receives --help/-h itself instead of the generated help.
    CommandBuilder& withoutHelp();

    /// Routes normally but is left out of help listings.
    CommandBuilder& hidden();

    const CommandDefinition& definition() const { return *def; }

private:
    friend class CliBuilder;
    CommandBuilder(CliBuilder& owner, CommandDefinition& def) : owner(&owner), def(&def) {}

    CliBuilder* owner;
    CommandDefinition* def;
};

/**
 * @brief Collects commands, middleware and options into a CliApplication
 *
 *   CliBuilder cli;
 *   cli.addCommand<GreetCommand>("greet", "Greets a person")
 *      .addOption("name", 'n', "Who to greet", false, std::string("World"));
 *   cli.useValidation();
 *   auto app = cli.build();
 *   return app->run(argc, argv);
 */
class CliBuilder {
public:
    template <typename TCommand>
    CommandBuilder addCommand(const std::string& name,
                              const std::string& description = "",
                              std::vector<std::string> aliases = {}) {
        CommandDefinition def;
        def.name = name;
        def.description = description;
        def.aliases = std::move(aliases);
        return addDefinition<TCommand>(std::move(def));
    }

    /// Subcommand of parent, given as a name or dotted path ("git.remote").
    template <typename TCommand>
    CommandBuilder addSubCommand(const std::string& name,
                                 const std::string& parent,
                                 const std::string& description = "") {
        CommandDefinition def;
        def.name = name;
        def.parent = parent;
        def.description = description;
        return addDefinition<TCommand>(std::move(def));
    }

    CliBuilder& useMiddleware(std::unique_ptr<ICommandMiddleware> middleware);
    CliBuilder& useMiddleware(MiddlewareFunction middleware);
    CliBuilder& useValidation();
    CliBuilder& useLogging(LogLevel level = LogLevel::Info);

    CliBuilder& withParserOptions(ParserOptions options);
    CliBuilder& withOutput(std::unique_ptr<IOutputSink> output);

    /**
     * @brief Registers every collected definition and hands everything to a new application
     *
     * @throws DuplicateNameError / ConfigurationError from registration
     */
    std::unique_ptr<CliApplication> build();

private:
    friend class CommandBuilder;

    template <typename TCommand>
    CommandBuilder addDefinition(CommandDefinition def) {
        def.commandType = commandTypeOf<TCommand>();
        if (!factory.contains(def.commandType)) {
            factory.registerType<TCommand>(def.commandType);
        }
        pending.push_back(std::make_unique<CommandDefinition>(std::move(def)));
        return CommandBuilder(*this, *pending.back());
    }

    std::vector<std::unique_ptr<CommandDefinition>> pending;
    CommandFactory factory;
    MiddlewarePipeline pipeline;
    ParserOptions parserOptions;
    std::unique_ptr<IOutputSink> output;
};

template <typename TCommand>
CommandBuilder CommandBuilder::addCommand(const std::string& name, const std::string& description) {
    CommandDefinition child;
    child.name = name;
    child.parent = def->qualifiedName();
    child.description = description;
    return owner->addDefinition<TCommand>(std::move(child));
}

}
