#include "core/app_options.h"

#include "core/config_loader.h"
#include "logging/logger.h"
#include "session/session_types.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace live_asr {

namespace {

constexpr const char* kVersion = "0.3.0";

std::optional<unsigned int> parseUnsigned(std::string_view value) {
    const std::string buffer{value};
    if (buffer.empty() || buffer[0] == '-') {
        return std::nullopt;
    }
    char* end = nullptr;
    unsigned long parsed = std::strtoul(buffer.c_str(), &end, 10);
    if (!end || *end != '\0' || parsed == 0) {
        return std::nullopt;
    }
    return static_cast<unsigned int>(parsed);
}

std::optional<double> parsePositiveDouble(std::string_view value) {
    const std::string buffer{value};
    char* end = nullptr;
    double parsed = std::strtod(buffer.c_str(), &end);
    if (buffer.empty() || !end || *end != '\0' || !(parsed > 0.0)) {
        return std::nullopt;
    }
    return parsed;
}

bool checkMode(std::string_view value, ParseOptionsResult& result) {
    if (!session::parseSessionMode(value)) {
        result.hasError = true;
        result.errorMessage = "Unsupported mode '" + std::string(value) +
                              "'. Use one of: speed | quality | quality_v2";
        return false;
    }
    return true;
}

bool checkLogLevel(std::string_view value, ParseOptionsResult& result) {
    if (!logging::isValidLevelName(value)) {
        result.hasError = true;
        result.errorMessage =
            "Unsupported log level. Use one of: trace|debug|info|warn|error|critical|off";
        return false;
    }
    return true;
}

bool applyEnvOverrides(AppOptions& opt, ParseOptionsResult& result,
                       const std::function<const char*(const char*)>& getenvFn) {
    if (const char* config = getenvFn("LIVE_ASR_CONFIG")) {
        opt.configPath = config;
        opt.configPathGiven = true;
    }
    if (const char* device = getenvFn("LIVE_ASR_DEVICE")) {
        opt.device = device;
    }
    if (const char* token = getenvFn("LIVE_ASR_TOKEN")) {
        opt.token = token;
    }
    if (const char* mode = getenvFn("LIVE_ASR_MODE")) {
        if (!checkMode(mode, result)) {
            result.errorMessage = "LIVE_ASR_MODE: " + result.errorMessage;
            return false;
        }
        opt.mode = mode;
    }
    if (const char* level = getenvFn("LIVE_ASR_LOG_LEVEL")) {
        if (!checkLogLevel(level, result)) {
            result.errorMessage = "LIVE_ASR_LOG_LEVEL: " + result.errorMessage;
            return false;
        }
        opt.logLevel = level;
    }
    if (const char* endpoint = getenvFn("LIVE_ASR_CONTROL_ENDPOINT")) {
        opt.controlEndpoint = endpoint;
    }
    return true;
}

}  // namespace

void printHelp(std::string_view programName) {
    std::cout << "Usage: " << programName
              << " [--config config.json] [--device default|auto|hw:0,0] [--mode speed]"
              << " [--rate 16000] [--channels 1] [--chunk-seconds 0.2] [--queue 50]"
              << " [--log-level info] [--list-devices] [--help] [--version]" << std::endl
              << std::endl
              << "Live transcription bridge options:" << std::endl
              << "  -c, --config         JSON configuration file" << std::endl
              << "  -d, --device         ALSA capture device ('auto' picks the first input)"
              << std::endl
              << "  -m, --mode           Session mode: speed | quality | quality_v2" << std::endl
              << "  -r, --rate           Capture sample rate in Hz" << std::endl
              << "      --channels       Capture channel count" << std::endl
              << "      --chunk-seconds  Capture block and flush interval in seconds"
              << std::endl
              << "      --queue          Frame queue capacity" << std::endl
              << "      --control        Control endpoint (REQ)" << std::endl
              << "      --audio          Audio endpoint (PUSH)" << std::endl
              << "      --results        Result endpoint (SUB)" << std::endl
              << "      --log-level      trace | debug | info | warn | error | critical | off"
              << std::endl
              << "  -l, --list-devices   List ALSA capture devices and exit" << std::endl
              << "  -h, --help           Show this help and exit" << std::endl
              << "  -V, --version        Show version and exit" << std::endl
              << std::endl
              << "Environment overrides: LIVE_ASR_CONFIG, LIVE_ASR_DEVICE, LIVE_ASR_TOKEN, "
                 "LIVE_ASR_MODE, LIVE_ASR_LOG_LEVEL, LIVE_ASR_CONTROL_ENDPOINT"
              << std::endl
              << "The access token is read from LIVE_ASR_TOKEN or session.token in the config."
              << std::endl;
}

void printVersion(std::string_view programName) {
    std::cout << programName << " version " << kVersion << std::endl;
}

ParseOptionsResult parseOptions(int argc, char** argv, std::string_view programName,
                                const std::function<const char*(const char*)>& getenvFn) {
    AppOptions opt{};
    ParseOptionsResult result{};

    if (!applyEnvOverrides(opt, result, getenvFn)) {
        return result;
    }

    auto fail = [&](const std::string& message) {
        result.hasError = true;
        result.errorMessage = message;
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        const bool hasValue = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            printHelp(programName);
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            printVersion(programName);
            result.showVersion = true;
            return result;
        } else if (arg == "-l" || arg == "--list-devices") {
            opt.listDevices = true;
        } else if ((arg == "-c" || arg == "--config") && hasValue) {
            opt.configPath = argv[++i];
            opt.configPathGiven = true;
        } else if ((arg == "-d" || arg == "--device") && hasValue) {
            opt.device = argv[++i];
        } else if ((arg == "-m" || arg == "--mode") && hasValue) {
            const std::string_view value{argv[++i]};
            if (!checkMode(value, result)) {
                return result;
            }
            opt.mode = std::string(value);
        } else if ((arg == "-r" || arg == "--rate") && hasValue) {
            auto parsed = parseUnsigned(argv[++i]);
            if (!parsed) {
                return fail("Rate must be a positive integer");
            }
            opt.sampleRate = *parsed;
        } else if (arg == "--channels" && hasValue) {
            auto parsed = parseUnsigned(argv[++i]);
            if (!parsed) {
                return fail("Channels must be a positive integer");
            }
            opt.channels = *parsed;
        } else if (arg == "--chunk-seconds" && hasValue) {
            auto parsed = parsePositiveDouble(argv[++i]);
            if (!parsed) {
                return fail("Chunk duration must be a positive number of seconds");
            }
            opt.chunkDurationSeconds = *parsed;
        } else if (arg == "--queue" && hasValue) {
            auto parsed = parseUnsigned(argv[++i]);
            if (!parsed) {
                return fail("Queue capacity must be a positive integer");
            }
            opt.queueCapacity = *parsed;
        } else if (arg == "--control" && hasValue) {
            opt.controlEndpoint = argv[++i];
        } else if (arg == "--audio" && hasValue) {
            opt.audioEndpoint = argv[++i];
        } else if (arg == "--results" && hasValue) {
            opt.resultEndpoint = argv[++i];
        } else if (arg == "--log-level" && hasValue) {
            const std::string_view value{argv[++i]};
            if (!checkLogLevel(value, result)) {
                return result;
            }
            opt.logLevel = std::string(value);
        } else {
            return fail(std::string("Unknown argument: ") + std::string(arg));
        }
    }

    result.options = opt;
    return result;
}

void applyOptions(const AppOptions& options, AppConfig& config) {
    if (options.device) {
        config.audio.device = *options.device;
    }
    if (options.sampleRate) {
        config.audio.sampleRate = *options.sampleRate;
    }
    if (options.channels) {
        config.audio.channels = *options.channels;
    }
    if (options.chunkDurationSeconds) {
        config.audio.chunkDurationSeconds = *options.chunkDurationSeconds;
    }
    if (options.queueCapacity) {
        config.pipeline.queueCapacity = *options.queueCapacity;
    }
    if (options.mode) {
        config.session.mode = *options.mode;
    }
    if (options.token) {
        config.session.token = *options.token;
    }
    if (options.controlEndpoint) {
        config.session.controlEndpoint = *options.controlEndpoint;
    }
    if (options.audioEndpoint) {
        config.session.audioEndpoint = *options.audioEndpoint;
    }
    if (options.resultEndpoint) {
        config.session.resultEndpoint = *options.resultEndpoint;
    }
    if (options.logLevel) {
        config.logging.level = logging::stringToLevel(*options.logLevel);
    }
}

}  // namespace live_asr
