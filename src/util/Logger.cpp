#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace clicore {

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string v = toLower(trim(text));
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "warning" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return std::nullopt;
}

static LogLevel levelFromEnvironment() {
    const char* env = std::getenv(Constants::LOG_LEVEL_ENV);
    if (!env) return LogLevel::Warn;
    return parseLogLevel(env).value_or(LogLevel::Warn);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(levelFromEnvironment()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }
bool Logger::enabled(LogLevel level) const { return currentLevel >= level; }

void Logger::log(LogLevel level, const std::string& msg) const {
    switch (level) {
        case LogLevel::Error: error(msg); break;
        case LogLevel::Warn: warn(msg); break;
        case LogLevel::Info: info(msg); break;
        case LogLevel::Debug: debug(msg); break;
    }
}

void Logger::error(const std::string& msg) const { if (enabled(LogLevel::Error)) std::cerr << "[error] " << msg << "\n"; }
void Logger::warn(const std::string& msg) const { if (enabled(LogLevel::Warn)) std::cerr << "[warn ] " << msg << "\n"; }
void Logger::info(const std::string& msg) const { if (enabled(LogLevel::Info)) std::cout << "[info ] " << msg << "\n"; }
void Logger::debug(const std::string& msg) const { if (enabled(LogLevel::Debug)) std::cout << "[debug] " << msg << "\n"; }

}
