#pragma once

#include "pipeline/output_sink.h"
#include "pipeline/pipeline_flags.h"
#include "session/transcription_session.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace live_asr {
namespace pipeline {

/**
 * @brief Polls the session for results and forwards them to the sink in order.
 *
 * Exits when cancelled or when the remote side ends the stream. The idle retry sleep
 * is cut short by wake().
 */
class ResultReceiver {
   public:
    ResultReceiver(session::TranscriptionSession& session, OutputSink& sink, PipelineFlags& flags,
                   std::chrono::milliseconds idleRetry);

    ResultReceiver(const ResultReceiver&) = delete;
    ResultReceiver& operator=(const ResultReceiver&) = delete;

    void run();

    // Interrupt an idle sleep
    void wake();

    // True if run() returned because the remote side ended the stream
    bool endedByRemote() const {
        return endedByRemote_.load(std::memory_order_acquire);
    }
    std::uint64_t messagesReceived() const {
        return messages_.load(std::memory_order_relaxed);
    }

   private:
    void idleWait();

    session::TranscriptionSession& session_;
    OutputSink& sink_;
    PipelineFlags& flags_;
    const std::chrono::milliseconds idleRetry_;

    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    bool woken_ = false;
    std::atomic<bool> endedByRemote_{false};
    std::atomic<std::uint64_t> messages_{0};
};

}  // namespace pipeline
}  // namespace live_asr
