#ifndef DOCSIGN_LOGGER_HPP
#define DOCSIGN_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <atomic>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // Opens (appends to) a log file. An empty filename closes any open file.
    void init(const std::string& filename);
    void set_level(LogLevel level);
    void log(LogLevel level, const std::string& message);

    bool enabled(LogLevel level) const { return level >= min_level_; }

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args... args) {
        if (!enabled(level)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // DOCSIGN_LOGGER_HPP
