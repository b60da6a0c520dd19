#pragma once

#include "audio/pcm_reader.h"
#include "core/config_loader.h"
#include "core/interrupt_signal.h"
#include "pipeline/chunk_pump.h"
#include "pipeline/output_sink.h"
#include "pipeline/shutdown_coordinator.h"
#include "session/transcription_session.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace live_asr {
namespace pipeline {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

struct RunSummary {
    ChunkPumpStats pump;
    std::uint64_t framesDropped = 0;
    std::uint64_t blocksCaptured = 0;
    std::uint64_t messagesReceived = 0;
    std::optional<StopReason> reason;
    int failedShutdownSteps = 0;
    int exitCode = kExitOk;
};

/**
 * @brief One streaming run: capture -> channel -> pump -> session -> receiver -> sink.
 *
 * run() creates and starts the session, launches the capture, pump and receiver
 * threads, supervises them from the calling thread and performs the stop sequence.
 * It returns the process exit status.
 */
class StreamingPipeline {
   public:
    struct Dependencies {
        session::SessionFactory* factory = nullptr;
        std::function<std::unique_ptr<audio::PcmReader>()> makeReader;
        OutputSink* sink = nullptr;
        signals::SignalState* signalState = nullptr;  // polled by the supervisor if set
        bool installSignalHandlers = false;
    };

    StreamingPipeline(AppConfig config, Dependencies deps);

    int run();

    const RunSummary& summary() const {
        return summary_;
    }

   private:
    void closeRemoteSession(const std::string& taskId);

    AppConfig config_;
    Dependencies deps_;
    RunSummary summary_;
};

}  // namespace pipeline
}  // namespace live_asr
