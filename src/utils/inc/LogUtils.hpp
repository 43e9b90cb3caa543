#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

constexpr const char* DEFAULT_LOG_FILE = "log/kubeprov.log";

// Initialize the log system: colored console plus rotating file, async
void init(Level level = Level::Info,
          const std::string& log_file = DEFAULT_LOG_FILE,
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);
Level parse_level(const std::string& name);

// Logger instance, empty until init()
extern std::shared_ptr<spdlog::logger> logger;

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);
void fatal(const std::string& msg);

namespace detail {
void fallback(Level level, const std::string& msg);
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->debug(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Debug, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->info(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Info, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->warn(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Warn, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->error(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Error, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->critical(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Fatal, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = DEFAULT_LOG_FILE,
                size_t max_file_size = 1024 * 1024 * 5,
                size_t max_files = 3) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
