#include "core/config_loader.h"

#include "session/session_types.h"

#include <cmath>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace live_asr {

std::size_t chunkSizeBytes(const AppConfig::AudioConfig& audio) {
    const double bytes = static_cast<double>(audio.sampleRate) * audio.channels *
                         audio.sampleWidthBytes * audio.chunkDurationSeconds;
    return static_cast<std::size_t>(std::llround(bytes));
}

std::size_t blockFrames(const AppConfig::AudioConfig& audio) {
    const double frames = static_cast<double>(audio.sampleRate) * audio.chunkDurationSeconds;
    return static_cast<std::size_t>(std::llround(frames));
}

std::chrono::milliseconds chunkDuration(const AppConfig::AudioConfig& audio) {
    return std::chrono::milliseconds(std::llround(audio.chunkDurationSeconds * 1000.0));
}

std::chrono::milliseconds senderGrace(const AppConfig& config) {
    if (config.pipeline.senderGraceMs > 0) {
        return std::chrono::milliseconds(config.pipeline.senderGraceMs);
    }
    return 2 * chunkDuration(config.audio);
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("audio") && j["audio"].is_object()) {
            auto audio = j["audio"];
            try {
                if (audio.contains("device")) {
                    outConfig.audio.device = audio["device"].get<std::string>();
                }
                if (audio.contains("sampleRate")) {
                    outConfig.audio.sampleRate = audio["sampleRate"].get<unsigned int>();
                }
                if (audio.contains("channels")) {
                    outConfig.audio.channels = audio["channels"].get<unsigned int>();
                }
                if (audio.contains("sampleWidthBytes")) {
                    outConfig.audio.sampleWidthBytes = audio["sampleWidthBytes"].get<unsigned int>();
                }
                if (audio.contains("chunkDurationSeconds")) {
                    outConfig.audio.chunkDurationSeconds =
                        audio["chunkDurationSeconds"].get<double>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid audio settings, using defaults: {}", e.what());
                }
                outConfig.audio = AppConfig::AudioConfig{};
            }
        }

        if (j.contains("pipeline") && j["pipeline"].is_object()) {
            auto pipeline = j["pipeline"];
            try {
                if (pipeline.contains("queueCapacity")) {
                    outConfig.pipeline.queueCapacity = pipeline["queueCapacity"].get<std::size_t>();
                }
                if (pipeline.contains("receiverIdleRetryMs")) {
                    outConfig.pipeline.receiverIdleRetryMs =
                        pipeline["receiverIdleRetryMs"].get<int>();
                }
                if (pipeline.contains("senderGraceMs")) {
                    outConfig.pipeline.senderGraceMs = pipeline["senderGraceMs"].get<int>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid pipeline settings, using defaults: {}", e.what());
                }
                outConfig.pipeline = AppConfig::PipelineConfig{};
            }
        }

        if (j.contains("session") && j["session"].is_object()) {
            auto session = j["session"];
            try {
                if (session.contains("controlEndpoint")) {
                    outConfig.session.controlEndpoint =
                        session["controlEndpoint"].get<std::string>();
                }
                if (session.contains("audioEndpoint")) {
                    outConfig.session.audioEndpoint = session["audioEndpoint"].get<std::string>();
                }
                if (session.contains("resultEndpoint")) {
                    outConfig.session.resultEndpoint = session["resultEndpoint"].get<std::string>();
                }
                if (session.contains("mode")) {
                    outConfig.session.mode = session["mode"].get<std::string>();
                }
                if (session.contains("token")) {
                    outConfig.session.token = session["token"].get<std::string>();
                }
                if (session.contains("idleWindowMs")) {
                    outConfig.session.idleWindowMs = session["idleWindowMs"].get<int>();
                }
                if (session.contains("sendTimeoutMs")) {
                    outConfig.session.sendTimeoutMs = session["sendTimeoutMs"].get<int>();
                }
                if (session.contains("requestTimeoutMs")) {
                    outConfig.session.requestTimeoutMs = session["requestTimeoutMs"].get<int>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid session settings, using defaults: {}", e.what());
                }
                outConfig.session = AppConfig::SessionConfig{};
            }
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            auto logSection = j["logging"];
            try {
                if (logSection.contains("level")) {
                    outConfig.logging.level =
                        logging::stringToLevel(logSection["level"].get<std::string>());
                }
                if (logSection.contains("filePath")) {
                    outConfig.logging.filePath = logSection["filePath"].get<std::string>();
                }
                if (logSection.contains("maxFileSize")) {
                    outConfig.logging.maxFileSize = logSection["maxFileSize"].get<size_t>();
                }
                if (logSection.contains("maxBackups")) {
                    outConfig.logging.maxBackups = logSection["maxBackups"].get<size_t>();
                }
                if (logSection.contains("consoleOutput")) {
                    outConfig.logging.consoleOutput = logSection["consoleOutput"].get<bool>();
                }
                if (logSection.contains("coloredOutput")) {
                    outConfig.logging.coloredOutput = logSection["coloredOutput"].get<bool>();
                }
                if (logSection.contains("pattern")) {
                    outConfig.logging.pattern = logSection["pattern"].get<std::string>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid logging settings, using defaults: {}", e.what());
                }
                outConfig.logging = logging::LogConfig{};
            }
        }

        if (verbose) {
            LOG_INFO("Config: loaded {}", configPath.string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        return false;
    }
}

ErrorCode loadConfigFile(const std::filesystem::path& configPath, bool required,
                         AppConfig& outConfig) {
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        outConfig = AppConfig{};
        if (required) {
            return ErrorCode::VALIDATION_FILE_NOT_FOUND;
        }
        LOG_INFO("Config: {} not found, using defaults", configPath.string());
        return ErrorCode::OK;
    }
    if (!loadAppConfig(configPath, outConfig)) {
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    return ErrorCode::OK;
}

std::optional<std::string> validateAppConfig(const AppConfig& config) {
    const auto& audio = config.audio;
    if (audio.device.empty()) {
        return std::string("audio.device must not be empty");
    }
    if (audio.sampleRate < 8000 || audio.sampleRate > 192000) {
        return std::string("audio.sampleRate must be in 8000-192000");
    }
    if (audio.channels == 0 || audio.channels > 8) {
        return std::string("audio.channels must be in 1-8");
    }
    if (audio.sampleWidthBytes < 2 || audio.sampleWidthBytes > 4) {
        return std::string("audio.sampleWidthBytes must be 2, 3 or 4");
    }
    if (!(audio.chunkDurationSeconds >= 0.01 && audio.chunkDurationSeconds <= 5.0)) {
        return std::string("audio.chunkDurationSeconds must be in 0.01-5.0");
    }
    if (blockFrames(audio) == 0) {
        return std::string("audio block size evaluates to zero frames");
    }

    const auto& pipeline = config.pipeline;
    if (pipeline.queueCapacity == 0) {
        return std::string("pipeline.queueCapacity must be positive");
    }
    if (pipeline.receiverIdleRetryMs <= 0) {
        return std::string("pipeline.receiverIdleRetryMs must be positive");
    }
    if (pipeline.senderGraceMs < 0) {
        return std::string("pipeline.senderGraceMs must not be negative");
    }

    const auto& session = config.session;
    if (session.controlEndpoint.empty() || session.audioEndpoint.empty() ||
        session.resultEndpoint.empty()) {
        return std::string("session endpoints must not be empty");
    }
    if (!session::parseSessionMode(session.mode)) {
        return "unsupported session.mode '" + session.mode +
               "' (expected 'speed' 'quality' or 'quality_v2')";
    }
    if (session.idleWindowMs <= 0 || session.sendTimeoutMs <= 0 ||
        session.requestTimeoutMs <= 0) {
        return std::string("session timeouts must be positive");
    }

    return std::nullopt;
}

std::string redactToken(const std::string& token) {
    if (token.empty()) {
        return "<empty>";
    }
    return "<redacted:" + std::to_string(token.size()) + " chars>";
}

}  // namespace live_asr
