#include "logger.hpp"

void Logger::debug(const std::string& msg) {
    if (level >= LogLevel::DEBUG) {
        write(ansi::gray, "[DEBUG] ", msg);
    }
}

void Logger::info(const std::string& msg) {
    if (level >= LogLevel::INFO) {
        write(ansi::white, "[INFO] ", msg);
    }
}

// Warnings share the INFO threshold.
void Logger::warn(const std::string& msg) {
    if (level >= LogLevel::INFO) {
        write(ansi::yellow, "[WARN] ", msg);
    }
}

void Logger::error(const std::string& msg) {
    if (level >= LogLevel::ERROR) {
        write(ansi::red, "[ERROR] ", msg);
    }
}

void Logger::write(const std::string& color, const char* tag, const std::string& msg) {
    if (colors) {
        out << color << tag << msg << ansi::reset << "\n";
    } else {
        out << tag << msg << "\n";
    }
}
