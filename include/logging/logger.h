/**
 * @file logger.h
 * @brief Process-wide spdlog logger for live_asr_bridge
 *
 * One named logger writes to stderr and, optionally, a rotating file. Code logs through
 * the LOG_* macros; the first macro call creates a stderr logger if nothing has been
 * configured yet.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace live_asr {
namespace logging {

// Same order as spdlog::level::level_enum
enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty: stderr only
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief (Re)build the logger from @p config.
 *
 * Replaces any earlier logger, including the one made by initializeEarly().
 * @return false if a sink could not be created (e.g. unwritable log file)
 */
bool initialize(const LogConfig& config = LogConfig{});

/// Plain stderr logger for the window before the config file is read.
bool initializeEarly();

void shutdown();

std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Parse a level name, case-insensitive.
 *
 * Accepts the canonical names plus "warning", "err", "fatal" and "none".
 * Unknown names map to Info; check with isValidLevelName() first.
 */
LogLevel stringToLevel(std::string_view name);
bool isValidLevelName(std::string_view name);

}  // namespace logging
}  // namespace live_asr

#include <spdlog/spdlog.h>

#define LIVE_ASR_LOG_AT(spdlogMacro, ...)               \
    do {                                                \
        auto logger_ = live_asr::logging::getLogger();  \
        if (logger_)                                    \
            spdlogMacro(logger_, __VA_ARGS__);          \
    } while (0)

#define LOG_DEBUG(...) LIVE_ASR_LOG_AT(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) LIVE_ASR_LOG_AT(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) LIVE_ASR_LOG_AT(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) LIVE_ASR_LOG_AT(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) LIVE_ASR_LOG_AT(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// Emits the 1st, (n+1)th, (2n+1)th... call at this site
#define LOG_EVERY_N(level, n, ...)                                  \
    do {                                                            \
        static std::atomic<std::uint64_t> every_n_count_{0};        \
        if (every_n_count_.fetch_add(1) % (n) == 0) {               \
            LOG_##level(__VA_ARGS__);                               \
        }                                                           \
    } while (0)
