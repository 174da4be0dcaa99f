#pragma once

#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace hotset {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

inline LogLevel ParseLogLevel(std::string_view name) {
    if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
    if (name == "info" || name == "INFO") return LogLevel::INFO;
    if (name == "warn" || name == "WARN") return LogLevel::WARN;
    if (name == "error" || name == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level) {
        currentLevel_ = level;
    }

    LogLevel logLevel() const { return currentLevel_; }

    // Redirects every subsequent line; the stream must outlive its use here.
    void setOutput(std::ostream& out) {
        out_ = &out;
    }

    void resetOutput() {
        out_ = &std::cout;
    }

    template<typename... Args>
    void debug(const char* file, int line, Args&&... args) {
        if (currentLevel_ <= LogLevel::DEBUG) {
            log("DEBUG", file, line, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debugf(const char* file, int line, std::string_view pattern, Args&&... args) {
        if (currentLevel_ <= LogLevel::DEBUG) {
            logf("DEBUG", file, line, pattern, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(const char* file, int line, Args&&... args) {
        if (currentLevel_ <= LogLevel::INFO) {
            log("INFO ", file, line, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void infof(const char* file, int line, std::string_view pattern, Args&&... args) {
        if (currentLevel_ <= LogLevel::INFO) {
            logf("INFO ", file, line, pattern, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(const char* file, int line, Args&&... args) {
        if (currentLevel_ <= LogLevel::WARN) {
            log("WARN ", file, line, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warnf(const char* file, int line, std::string_view pattern, Args&&... args) {
        if (currentLevel_ <= LogLevel::WARN) {
            logf("WARN ", file, line, pattern, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(const char* file, int line, Args&&... args) {
        if (currentLevel_ <= LogLevel::ERROR) {
            log("ERROR", file, line, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void errorf(const char* file, int line, std::string_view pattern, Args&&... args) {
        if (currentLevel_ <= LogLevel::ERROR) {
            logf("ERROR", file, line, pattern, std::forward<Args>(args)...);
        }
    }

private:
    Logger() : currentLevel_(LogLevel::INFO), out_(&std::cout) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename T>
    void printArg(T&& arg) {
        *out_ << std::forward<T>(arg);
    }

    template<typename... Args>
    void log(const char* level, const char* file, int line, Args&&... args) {
        writeHeader(level, file, line);
        (printArg(std::forward<Args>(args)), ...);
        *out_ << std::endl;
    }

    template<typename... Args>
    void logf(const char* level, const char* file, int line, std::string_view pattern, Args&&... args) {
        writeHeader(level, file, line);
        *out_ << fmt::format(fmt::runtime(pattern), std::forward<Args>(args)...);
        *out_ << std::endl;
    }

    void writeHeader(const char* level, const char* file, int line) {
        auto now = std::time(nullptr);
        auto* tm = std::localtime(&now);
        const char* filename = strrchr(file, '/');
        filename = filename ? filename + 1 : file;
        *out_ << "[" << std::put_time(tm, "%Y-%m-%d %H:%M:%S") << "] "
              << "[" << level << "] "
              << "[" << filename << ":" << line << "] ";
    }

    LogLevel currentLevel_;
    std::ostream* out_;
};

#define LOG_DEBUG(...) ::hotset::Logger::getInstance().debug(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_DEBUGF(...) ::hotset::Logger::getInstance().debugf(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_INFO(...) ::hotset::Logger::getInstance().info(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_INFOF(...) ::hotset::Logger::getInstance().infof(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARN(...) ::hotset::Logger::getInstance().warn(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARNF(...) ::hotset::Logger::getInstance().warnf(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...) ::hotset::Logger::getInstance().error(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERRORF(...) ::hotset::Logger::getInstance().errorf(__FILE__, __LINE__, __VA_ARGS__)

} // namespace hotset
