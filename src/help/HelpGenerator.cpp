#include "help/HelpGenerator.hpp"

#include <algorithm>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace clicore {

namespace {

const std::string& describe(const std::string& description) {
    static const std::string fallback = Constants::NO_DESCRIPTION;
    return description.empty() ? fallback : description;
}

std::string defaultSuffix(const std::optional<std::string>& defaultValue) {
    return defaultValue ? " (default: " + *defaultValue + ")" : std::string();
}

}

HelpGenerator::HelpGenerator(const CommandRegistry& registry, IOutputSink& output)
    : registry(registry), output(output) {}

void HelpGenerator::renderGlobalHelp() const {
    output.writeLine("Usage: [command] [options]");
    output.writeLine("");
    output.writeLine("Available commands:");
    output.writeLine("");

    renderCommandTree("", 0);

    output.writeLine("");
    output.writeLine("Options:");
    renderHelpOptionLine(Constants::COMMAND_COLUMN_WIDTH);
    output.writeLine("");
    output.writeLine("Run '[command] --help' for more information on a command.");
}

void HelpGenerator::renderCommandTree(const std::string& parentPath, size_t level) const {
    const size_t indent = level * Constants::INDENT_WIDTH;
    const size_t width = Constants::COMMAND_COLUMN_WIDTH > indent ? Constants::COMMAND_COLUMN_WIDTH - indent : 0;

    for (const CommandDefinition* cmd : visibleChildren(parentPath)) {
        output.writeLine("  " + std::string(indent, ' ') + padRight(cmd->name, width) + " " + describe(cmd->description));
        renderCommandTree(cmd->qualifiedName(), level + 1);
    }
}

void HelpGenerator::renderCommandHelp(const CommandDefinition& command, const std::vector<std::string>& commandPath) const {
    const std::string fullName = commandPath.empty() ? command.name : join(commandPath, " ");
    const auto children = visibleChildren(command.qualifiedName());

    if (!children.empty()) {
        renderGroupHelp(command, fullName, children);
    } else {
        renderLeafHelp(command, fullName);
    }
}

void HelpGenerator::renderGroupHelp(const CommandDefinition& command, const std::string& fullName,
                                    const std::vector<const CommandDefinition*>& children) const {
    output.writeLine("Usage: " + fullName + " <command> [options]");
    output.writeLine("");

    if (!command.description.empty()) {
        output.writeLine(command.description);
        output.writeLine("");
    }

    output.writeLine("Commands:");
    output.writeLine("");
    for (const CommandDefinition* child : children) {
        output.writeLine("  " + padRight(child->name, Constants::COMMAND_COLUMN_WIDTH) + " " + describe(child->description));
    }

    output.writeLine("");
    output.writeLine("Options:");
    renderHelpOptionLine(Constants::COMMAND_COLUMN_WIDTH);
    output.writeLine("");
    output.writeLine("Run '" + fullName + " <command> --help' for more information on a command.");
}

void HelpGenerator::renderLeafHelp(const CommandDefinition& command, const std::string& fullName) const {
    const auto arguments = command.argumentsByPosition();

    std::vector<std::string> usage{fullName};
    for (const ArgumentDefinition* arg : arguments) {
        usage.push_back(arg->required ? "<" + arg->name + ">" : "[" + arg->name + "]");
    }
    usage.push_back("[options]");
    output.writeLine("Usage: " + join(usage, " "));
    output.writeLine("");

    if (!command.description.empty()) {
        output.writeLine(command.description);
        output.writeLine("");
    }

    if (!arguments.empty()) {
        output.writeLine("Arguments:");
        for (const ArgumentDefinition* arg : arguments) {
            std::string line = "  " + padRight(arg->name, Constants::ARGUMENT_COLUMN_WIDTH) + " " + describe(arg->description);
            if (!arg->valueType.isString()) line += " [" + arg->valueType.name() + "]";
            if (arg->required) line += " (required)";
            line += defaultSuffix(arg->defaultValue);
            output.writeLine(line);
        }
        output.writeLine("");
    }

    output.writeLine("Options:");
    if (command.options.empty()) {
        renderHelpOptionLine(Constants::COMMAND_COLUMN_WIDTH);
        return;
    }

    for (const auto& option : command.options) {
        std::string display = option.displayName();
        if (option.hasValue && !option.valueType.isBoolean()) {
            display += " <" + toLower(option.valueType.name()) + ">";
        }
        std::string line = "  " + padRight(display, Constants::OPTION_COLUMN_WIDTH) + " " + describe(option.description);
        if (option.required) line += " (required)";
        line += defaultSuffix(option.defaultValue);
        output.writeLine(line);
    }
    renderHelpOptionLine(Constants::OPTION_COLUMN_WIDTH);
}

void HelpGenerator::renderHelpOptionLine(size_t width) const {
    output.writeLine("  " + padRight(Constants::HELP_OPTION_DISPLAY, width) + " " + Constants::HELP_OPTION_DESCRIPTION);
}

std::vector<const CommandDefinition*> HelpGenerator::visibleChildren(const std::string& parentPath) const {
    std::vector<const CommandDefinition*> children =
        parentPath.empty() ? registry.rootCommands() : registry.subcommands(parentPath);
    children.erase(std::remove_if(children.begin(), children.end(),
                                  [](const CommandDefinition* c) { return c->hidden; }),
                   children.end());
    std::stable_sort(children.begin(), children.end(), [](const CommandDefinition* a, const CommandDefinition* b) {
        return CaseInsensitiveLess{}(a->name, b->name);
    });
    return children;
}

}
