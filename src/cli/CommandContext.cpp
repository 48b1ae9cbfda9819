#include "cli/CommandContext.hpp"

#include "util/StringUtils.hpp"

namespace clicore {

CommandContext::CommandContext(ParsedArguments arguments,
                               std::vector<std::string> rawArgs,
                               std::vector<std::string> commandPath,
                               const CommandDefinition* definition,
                               IOutputSink& output)
    : args(std::move(arguments)),
      raw(std::move(rawArgs)),
      path(std::move(commandPath)),
      name(join(path, " ")),
      def(definition),
      sink(&output) {}

}
