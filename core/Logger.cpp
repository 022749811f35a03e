#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <atomic>
#include <filesystem>
#include <mutex>

namespace ward {

namespace {
std::mutex g_logger_init_mutex;
}

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

LogLevel LogLevelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                  [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace")                       return LogLevel::TRACE;
    if (lower == "debug")                       return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning")  return LogLevel::WARN;
    if (lower == "error")                       return LogLevel::ERROR;
    if (lower == "critical")                    return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::Initialize(const std::string& log_file_path, size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(g_logger_init_mutex);

    try {
        std::filesystem::path log_path(log_file_path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_path, max_file_size, max_files);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");

        if (auto previous = std::atomic_load(&logger_)) {
            spdlog::drop(previous->name());
        }

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("Ward", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::err);

        spdlog::register_logger(logger);
        std::atomic_store(&logger_, logger);

        logger->info("Logger initialized: {}", log_file_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to initialize logger: %s\n", ex.what());
        throw;
    }
}

void Logger::SetLevel(LogLevel level) {
    auto logger = Get();

    switch (level) {
        case LogLevel::TRACE:    logger->set_level(spdlog::level::trace); break;
        case LogLevel::DEBUG:    logger->set_level(spdlog::level::debug); break;
        case LogLevel::INFO:     logger->set_level(spdlog::level::info); break;
        case LogLevel::WARN:     logger->set_level(spdlog::level::warn); break;
        case LogLevel::ERROR:    logger->set_level(spdlog::level::err); break;
        case LogLevel::CRITICAL: logger->set_level(spdlog::level::critical); break;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(g_logger_init_mutex);
    if (auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>())) {
        logger->flush();
        spdlog::shutdown();
    }
}

// Components used without Initialize() (tests, tools) log to the console only,
// so nothing is written under logs/ as a side effect.
std::shared_ptr<spdlog::logger> Logger::CreateConsoleOnly() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    auto logger = std::make_shared<spdlog::logger>("Ward", console_sink);
    logger->set_level(spdlog::level::warn);
    return logger;
}

// The mutex is only taken on the first call; every later call is a lock-free load.
std::shared_ptr<spdlog::logger> Logger::Get() {
    if (auto logger = std::atomic_load(&logger_)) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(g_logger_init_mutex);
    auto logger = std::atomic_load(&logger_);
    if (!logger) {
        logger = CreateConsoleOnly();
        std::atomic_store(&logger_, logger);
    }
    return logger;
}

} // namespace ward
