#include "core/ArgumentParser.hpp"

#include "util/StringUtils.hpp"

namespace clicore {

ArgumentParser::ArgumentParser(ParserOptions options) : opts(options) {}

ParsedArguments ArgumentParser::parse(const std::vector<std::string>& args) const {
    ParsedArguments result;
    bool endOfOptions = false;
    size_t i = 0;

    while (i < args.size()) {
        const std::string& arg = args[i];

        if (endOfOptions) {
            result.addPositional(arg);
            ++i;
            continue;
        }

        if (arg == "--") {
            endOfOptions = true;
            ++i;
            continue;
        }

        if (arg.size() > 2 && startsWith(arg, "--")) {
            i = parseLongOption(args, i, result);
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
            i = parseShortOption(args, i, result);
            continue;
        }

        if (opts.allowWindowsStyle && arg.size() > 1 && arg[0] == '/') {
            i = parseWindowsOption(args, i, result);
            continue;
        }

        result.addPositional(arg);
        ++i;
    }

    return result;
}

bool ArgumentParser::isOptionLike(const std::string& token) const {
    if (token.empty()) return false;
    return token[0] == '-' || (opts.allowWindowsStyle && token[0] == '/');
}

size_t ArgumentParser::parseLongOption(const std::vector<std::string>& args, size_t index, ParsedArguments& result) const {
    std::string option = args[index].substr(2);
    size_t eq = option.find('=');

    // "--=x" has no name before '=', so it stays a flag named "=x"
    if (eq != std::string::npos && eq > 0) {
        result.addOption(option.substr(0, eq), option.substr(eq + 1));
        return index + 1;
    }

    // Long options never take the following token as their value
    result.addOption(option);
    return index + 1;
}

size_t ArgumentParser::parseShortOption(const std::vector<std::string>& args, size_t index, ParsedArguments& result) const {
    std::string options = args[index].substr(1);

    if (options.size() == 1) {
        return consumeValue(args, index, options, result);
    }

    if (opts.allowCombinedShortOptions) {
        for (char c : options) {
            result.addOption(std::string(1, c));
        }
        return index + 1;
    }

    result.addOption(options);
    return index + 1;
}

size_t ArgumentParser::parseWindowsOption(const std::vector<std::string>& args, size_t index, ParsedArguments& result) const {
    return consumeValue(args, index, args[index].substr(1), result);
}

size_t ArgumentParser::consumeValue(const std::vector<std::string>& args, size_t index, const std::string& name, ParsedArguments& result) const {
    if (index + 1 < args.size() && !isOptionLike(args[index + 1])) {
        result.addOption(name, args[index + 1]);
        return index + 2;
    }
    result.addOption(name);
    return index + 1;
}

}
