#pragma once

#include <cstddef>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace live_asr {

struct AppConfig;

// Command-line and environment overrides applied on top of the JSON config.
// Unset fields leave the file value in place.
struct AppOptions {
    std::string configPath{"config.json"};
    bool configPathGiven{false};  // set by --config or LIVE_ASR_CONFIG
    std::optional<std::string> device;
    std::optional<std::string> mode;
    std::optional<std::string> token;
    std::optional<std::string> logLevel;
    std::optional<std::string> controlEndpoint;
    std::optional<std::string> audioEndpoint;
    std::optional<std::string> resultEndpoint;
    std::optional<unsigned int> sampleRate;
    std::optional<unsigned int> channels;
    std::optional<double> chunkDurationSeconds;
    std::optional<std::size_t> queueCapacity;
    bool listDevices{false};
};

struct ParseOptionsResult {
    std::optional<AppOptions> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

/**
 * @brief Parse argv with LIVE_ASR_* environment overrides.
 *
 * Environment values are applied first, then command-line flags, so a flag wins
 * over the environment. getenvFn is injectable for tests.
 */
ParseOptionsResult parseOptions(
    int argc, char** argv, std::string_view programName,
    const std::function<const char*(const char*)>& getenvFn = ::getenv);

// Overlay the set fields of options onto config
void applyOptions(const AppOptions& options, AppConfig& config);

void printHelp(std::string_view programName);
void printVersion(std::string_view programName);

}  // namespace live_asr
