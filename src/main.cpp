#include "audio/alsa_capture.h"
#include "core/app_options.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "core/interrupt_signal.h"
#include "logging/logger.h"
#include "pipeline/output_sink.h"
#include "pipeline/streaming_pipeline.h"
#include "session/zmq_session.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

int listDevices() {
    const auto devices = live_asr::audio::listCaptureDevices();
    if (devices.empty()) {
        std::cout << "No ALSA capture devices found" << std::endl;
        return EXIT_SUCCESS;
    }
    for (const auto& device : devices) {
        std::cout << device.name;
        if (!device.description.empty()) {
            std::cout << "  (" << device.description << ")";
        }
        std::cout << std::endl;
    }
    return EXIT_SUCCESS;
}

int runBridge(const live_asr::AppOptions& options) {
    using namespace live_asr;

    AppConfig config;
    const ErrorCode loaded =
        loadConfigFile(options.configPath, options.configPathGiven, config);
    if (loaded != ErrorCode::OK) {
        LOG_ERROR("{}: {}", errorCodeToString(loaded), options.configPath);
        return EXIT_FAILURE;
    }
    applyOptions(options, config);

    if (auto error = validateAppConfig(config)) {
        LOG_ERROR("{}: {}", errorCodeToString(ErrorCode::VALIDATION_INVALID_CONFIG), *error);
        return EXIT_FAILURE;
    }

    logging::initialize(config.logging);

    if (auto device = audio::selectCaptureDevice(config.audio.device)) {
        config.audio.device = *device;
    } else {
        LOG_ERROR("{}: no capture device for '{}'",
                  errorCodeToString(ErrorCode::CAPTURE_DEVICE_NOT_FOUND), config.audio.device);
        return EXIT_FAILURE;
    }

    LOG_INFO("[live_asr_bridge] start device={} rate={} ch={} width={} chunk={}s ({} bytes) "
             "queue={} mode={} control={} token={}",
             config.audio.device, config.audio.sampleRate, config.audio.channels,
             config.audio.sampleWidthBytes, config.audio.chunkDurationSeconds,
             chunkSizeBytes(config.audio), config.pipeline.queueCapacity, config.session.mode,
             config.session.controlEndpoint, redactToken(config.session.token));

    session::ZmqSessionFactory factory(config.session);
    pipeline::StdoutSink sink;

    pipeline::StreamingPipeline::Dependencies deps;
    deps.factory = &factory;
    deps.makeReader = [] { return std::make_unique<audio::AlsaCapture>(); };
    deps.sink = &sink;
    deps.signalState = &signals::getGlobalSignalState();
    deps.installSignalHandlers = true;

    pipeline::StreamingPipeline streaming(config, std::move(deps));
    return streaming.run();
}

}  // namespace

int main(int argc, char** argv) {
    const std::string_view programName =
        (argc > 0 && argv[0] != nullptr) ? std::string_view{argv[0]} : "live_asr_bridge";

    live_asr::logging::initializeEarly();

    auto parsed = live_asr::parseOptions(argc, argv, programName);
    if (parsed.showHelp || parsed.showVersion) {
        return EXIT_SUCCESS;
    }
    if (parsed.hasError || !parsed.options) {
        LOG_ERROR("{}", parsed.errorMessage);
        return EXIT_FAILURE;
    }

    if (parsed.options->listDevices) {
        return listDevices();
    }

    int rc = EXIT_FAILURE;
    try {
        rc = runBridge(*parsed.options);
    } catch (const std::exception& e) {
        LOG_CRITICAL("[live_asr_bridge] Fatal: {}", e.what());
        rc = EXIT_FAILURE;
    }
    live_asr::logging::shutdown();
    return rc;
}
