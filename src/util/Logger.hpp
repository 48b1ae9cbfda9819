#pragma once

#include <optional>
#include <string>

namespace clicore {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/// Parses "error|warn|info|debug" or "0".."3"; anything else yields nullopt.
std::optional<LogLevel> parseLogLevel(const std::string& text);

class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;
    void log(LogLevel level, const std::string& msg) const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
};

}
