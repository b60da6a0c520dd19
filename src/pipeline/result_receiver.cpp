#include "pipeline/result_receiver.h"

#include "logging/logger.h"

namespace live_asr {
namespace pipeline {

ResultReceiver::ResultReceiver(session::TranscriptionSession& session, OutputSink& sink,
                               PipelineFlags& flags, std::chrono::milliseconds idleRetry)
    : session_(session), sink_(sink), flags_(flags), idleRetry_(idleRetry) {}

void ResultReceiver::wake() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        woken_ = true;
    }
    waitCv_.notify_all();
}

void ResultReceiver::idleWait() {
    std::unique_lock<std::mutex> lock(waitMutex_);
    waitCv_.wait_for(lock, idleRetry_, [this] { return woken_; });
}

void ResultReceiver::run() {
    LOG_DEBUG("[ResultReceiver] started");

    while (!flags_.isCancelled()) {
        auto message = session_.readNext(std::nullopt);
        if (!message) {
            if (session_.remoteEnded()) {
                endedByRemote_.store(true, std::memory_order_release);
                LOG_INFO("[ResultReceiver] Remote side ended the stream");
                break;
            }
            idleWait();
            continue;
        }
        messages_.fetch_add(1, std::memory_order_relaxed);
        sink_.write(*message);
    }

    LOG_INFO("[ResultReceiver] exit: {} messages received", messagesReceived());
}

}  // namespace pipeline
}  // namespace live_asr
