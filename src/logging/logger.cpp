#include "logging/logger.h"

#include <array>
#include <cctype>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace live_asr {
namespace logging {

namespace {

constexpr const char* kLoggerName = "live_asr";

struct LevelName {
    const char* name;
    LogLevel level;
};

constexpr std::array<LevelName, 11> kLevelNames{{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"err", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"fatal", LogLevel::Critical},
    {"off", LogLevel::Off},
    {"none", LogLevel::Off},
}};

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
std::atomic<bool> g_ready{false};

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

const LevelName* findLevel(std::string_view name) {
    std::string lower(name);
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (const auto& entry : kLevelNames) {
        if (lower == entry.name) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<spdlog::sink_ptr> makeSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    return sinks;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    std::shared_ptr<spdlog::logger> logger;
    try {
        auto sinks = makeSinks(config);
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    logger->set_level(toSpdlog(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::err);

    if (g_logger) {
        g_logger->flush();
    }
    g_logger = logger;
    spdlog::set_default_logger(logger);
    g_ready.store(true, std::memory_order_release);

    if (!config.filePath.empty()) {
        SPDLOG_LOGGER_INFO(logger, "Log file: {} (max {}MB x {} backups)", config.filePath,
                           config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    LogConfig config;
    config.coloredOutput = false;
    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_ready.store(false, std::memory_order_release);
    if (g_logger) {
        g_logger->flush();
    }
    spdlog::shutdown();
    g_logger.reset();
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!g_ready.load(std::memory_order_acquire)) {
        initialize();
    }
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger;
}

LogLevel stringToLevel(std::string_view name) {
    const LevelName* entry = findLevel(name);
    return entry ? entry->level : LogLevel::Info;
}

bool isValidLevelName(std::string_view name) {
    return findLevel(name) != nullptr;
}

}  // namespace logging
}  // namespace live_asr
