#pragma once

#include "pipeline/pipeline_flags.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace live_asr {
namespace pipeline {

enum class StopReason {
    Interrupt,    // SIGINT / SIGTERM
    StreamEnded,  // remote side finished the stream
    TaskExited,   // a pipeline task returned
    TaskFailure,  // a pipeline task threw
    Requested,    // stop sequence run without a prior request
};

const char* stopReasonToString(StopReason reason);

/**
 * @brief Owns the cancellation flag and the ordered, run-once stop sequence.
 *
 * Running -> Stopping happens on the first requestStop(); later requests are no-ops.
 * runStopSequence() executes the steps below exactly once, even when called
 * concurrently, and every step runs even if an earlier one threw:
 *   1. wake waiters, then give the sender its grace period for the pre-stop flush
 *   2. stop the session; sessionClosed is set whether or not stop() threw
 *   3. join all pipeline tasks
 *   4. release the interrupt-signal registration
 *   5. close the remote session
 */
class ShutdownCoordinator {
   public:
    enum class State { Running, Stopping, Stopped };

    struct Steps {
        std::function<void()> wakeWaiters;
        std::function<bool(std::chrono::milliseconds)> awaitSender;  // true if it exited
        std::function<void()> stopSession;
        std::function<void()> awaitTasks;
        std::function<void()> releaseSignals;
        std::function<void()> closeRemoteSession;
    };

    ShutdownCoordinator(PipelineFlags& flags, Steps steps, std::chrono::milliseconds senderGrace);

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /**
     * @brief Move to Stopping and set the cancellation flag.
     *
     * Safe from any thread except a signal handler.
     * @return true only for the call that performed the transition
     */
    bool requestStop(StopReason reason, const std::string& detail = {});

    // Supervisor wait; true once a stop has been requested
    bool waitForStopRequest(std::chrono::milliseconds timeout);

    // @return false if the sequence already ran or is running on another thread
    bool runStopSequence();

    State state() const {
        return state_.load(std::memory_order_acquire);
    }
    std::optional<StopReason> reason() const;
    std::string reasonDetail() const;

    // Steps whose action threw during the sequence
    int failedSteps() const {
        return failedSteps_.load();
    }

   private:
    void runStep(int number, const char* description, const std::function<void()>& action);

    PipelineFlags& flags_;
    Steps steps_;
    const std::chrono::milliseconds senderGrace_;

    std::atomic<State> state_{State::Running};
    std::atomic<bool> sequenceRan_{false};
    std::atomic<int> failedSteps_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<StopReason> reason_;
    std::string reasonDetail_;
};

}  // namespace pipeline
}  // namespace live_asr
