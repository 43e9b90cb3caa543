#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

namespace {

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// Prints the full, fixed-width level name ("WARN ", "FATAL") instead of spdlog's short form
class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

// The custom flag only takes effect once the pattern is compiled after add_flag
std::unique_ptr<spdlog::formatter> make_formatter() {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFullNameFormatter>('*').set_pattern("%Y-%m-%d %H:%M:%S.%f %t %* %v");
    return formatter;
}

}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    if (logger) {
        shutdown();
    }

    std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    spdlog::init_thread_pool(8192, 1);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    for (auto& sink : sinks) {
        sink->set_formatter(make_formatter());
    }

    logger = std::make_shared<spdlog::async_logger>(
        "kubeprov", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) logger->flush();
    logger.reset();
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "debug") return Level::Debug;
    if (lower == "info")  return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal" || lower == "critical") return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

namespace detail {

void fallback(Level level, const std::string& msg) {
    switch (level) {
        case Level::Debug: std::cout << "[DEBUG] " << msg << std::endl; break;
        case Level::Info:  std::cout << "[INFO] " << msg << std::endl; break;
        case Level::Warn:  std::cout << "[WARN] " << msg << std::endl; break;
        case Level::Error: std::cerr << "[ERROR] " << msg << std::endl; break;
        case Level::Fatal: std::cerr << "[FATAL] " << msg << std::endl; break;
    }
}

}

void debug(const std::string& msg) {
    if (logger) logger->debug(msg);
    else detail::fallback(Level::Debug, msg);
}

void info(const std::string& msg) {
    if (logger) logger->info(msg);
    else detail::fallback(Level::Info, msg);
}

void warn(const std::string& msg) {
    if (logger) logger->warn(msg);
    else detail::fallback(Level::Warn, msg);
}

void error(const std::string& msg) {
    if (logger) logger->error(msg);
    else detail::fallback(Level::Error, msg);
}

void fatal(const std::string& msg) {
    if (logger) logger->critical(msg);
    else detail::fallback(Level::Fatal, msg);
}

}
