#ifndef LIVE_ASR_CONFIG_LOADER_H
#define LIVE_ASR_CONFIG_LOADER_H

#include "core/error_codes.h"
#include "logging/logger.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace live_asr {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    struct AudioConfig {
        std::string device = "default";  // ALSA PCM name, or "auto" to pick the first input
        unsigned int sampleRate = 16000;
        unsigned int channels = 1;
        unsigned int sampleWidthBytes = 2;  // 2 = S16_LE, 3 = S24_3LE, 4 = S32_LE
        double chunkDurationSeconds = 0.2;  // capture block and flush interval
    } audio;

    struct PipelineConfig {
        std::size_t queueCapacity = 50;
        int receiverIdleRetryMs = 50;
        int senderGraceMs = 0;  // 0 = two chunk durations
    } pipeline;

    struct SessionConfig {
        std::string controlEndpoint = "tcp://127.0.0.1:7700";
        std::string audioEndpoint = "tcp://127.0.0.1:7701";
        std::string resultEndpoint = "tcp://127.0.0.1:7702";
        std::string mode = "speed";
        std::string token;  // bearer credential, never logged
        int idleWindowMs = 200;
        int sendTimeoutMs = 2000;
        int requestTimeoutMs = 5000;
    } session;

    logging::LogConfig logging;
};

/**
 * @brief Bytes in one capture frame / one wire chunk.
 *
 * sampleRate x channels x sampleWidthBytes x chunkDurationSeconds, e.g. 6400 bytes
 * for 16 kHz mono S16 at 0.2 s.
 */
std::size_t chunkSizeBytes(const AppConfig::AudioConfig& audio);

// Frames (samples per channel) per capture block
std::size_t blockFrames(const AppConfig::AudioConfig& audio);

std::chrono::milliseconds chunkDuration(const AppConfig::AudioConfig& audio);

// Grace period the shutdown sequence grants the sender for its pre-stop flush
std::chrono::milliseconds senderGrace(const AppConfig& config);

/**
 * @brief Load configuration from a JSON file.
 *
 * outConfig is reset to defaults first. Keys that are absent keep their default;
 * a section with a type error falls back to its defaults with a warning.
 *
 * @return false if the file is missing or is not valid JSON
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

/**
 * @brief Startup wrapper around loadAppConfig().
 *
 * A missing file is tolerated (defaults) unless @p required is set, as it is when the
 * path was named on the command line or in the environment.
 *
 * @return OK, VALIDATION_FILE_NOT_FOUND or VALIDATION_INVALID_CONFIG
 */
ErrorCode loadConfigFile(const std::filesystem::path& configPath, bool required,
                         AppConfig& outConfig);

/**
 * @brief Validate value ranges.
 *
 * @return Error message for the first invalid field, or std::nullopt if valid
 */
std::optional<std::string> validateAppConfig(const AppConfig& config);

// Render a credential for logs ("<redacted:42 chars>"); never contains the secret
std::string redactToken(const std::string& token);

}  // namespace live_asr

#endif  // LIVE_ASR_CONFIG_LOADER_H
