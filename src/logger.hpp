#pragma once
#include <iostream>
#include <string>

namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string red     = "\033[31m";
    const std::string yellow  = "\033[33m";
    const std::string white   = "\033[37m";
    const std::string gray    = "\033[90m";
}
enum class LogLevel {
    NONE,
    ERROR,
    INFO,
    DEBUG
};

// Writes "[LEVEL] message" lines to a stream. Colors are only emitted when
// explicitly enabled, so captured output stays plain.
class Logger {
public:
    explicit Logger(std::ostream& out = std::cerr, LogLevel level = LogLevel::INFO, bool colors = false)
        : out(out), level(level), colors(colors) {}

    void setLevel(LogLevel newLevel) {
        level = newLevel;
    }

    LogLevel getLevel() const {
        return level;
    }

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    void write(const std::string& color, const char* tag, const std::string& msg);

    std::ostream& out;
    LogLevel level;
    bool colors;
};
