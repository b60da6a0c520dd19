#include "pipeline/shutdown_coordinator.h"

#include "logging/logger.h"

#include <exception>

namespace live_asr {
namespace pipeline {

const char* stopReasonToString(StopReason reason) {
    switch (reason) {
    case StopReason::Interrupt:
        return "interrupt";
    case StopReason::StreamEnded:
        return "stream_ended";
    case StopReason::TaskExited:
        return "task_exited";
    case StopReason::TaskFailure:
        return "task_failure";
    case StopReason::Requested:
        return "requested";
    }
    return "unknown";
}

ShutdownCoordinator::ShutdownCoordinator(PipelineFlags& flags, Steps steps,
                                         std::chrono::milliseconds senderGrace)
    : flags_(flags), steps_(std::move(steps)), senderGrace_(senderGrace) {}

bool ShutdownCoordinator::requestStop(StopReason reason, const std::string& detail) {
    State expected = State::Running;
    if (!state_.compare_exchange_strong(expected, State::Stopping, std::memory_order_acq_rel)) {
        LOG_DEBUG("[Shutdown] Stop already requested, ignoring {}", stopReasonToString(reason));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reason_ = reason;
        reasonDetail_ = detail;
    }
    flags_.cancelled.store(true, std::memory_order_release);
    cv_.notify_all();

    if (detail.empty()) {
        LOG_INFO("[Shutdown] Stop requested ({})", stopReasonToString(reason));
    } else {
        LOG_INFO("[Shutdown] Stop requested ({}): {}", stopReasonToString(reason), detail);
    }
    return true;
}

bool ShutdownCoordinator::waitForStopRequest(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return reason_.has_value(); });
}

std::optional<StopReason> ShutdownCoordinator::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

std::string ShutdownCoordinator::reasonDetail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reasonDetail_;
}

void ShutdownCoordinator::runStep(int number, const char* description,
                                  const std::function<void()>& action) {
    LOG_INFO("[Shutdown]   Step {}: {}", number, description);
    if (!action) {
        return;
    }
    try {
        action();
    } catch (const std::exception& e) {
        failedSteps_.fetch_add(1);
        LOG_WARN("[Shutdown]   Step {} failed, continuing: {}", number, e.what());
    }
}

bool ShutdownCoordinator::runStopSequence() {
    if (sequenceRan_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    requestStop(StopReason::Requested);

    LOG_INFO("[Shutdown] Shutting down...");

    runStep(1, "Cancelling pipeline tasks", [this] {
        flags_.cancelled.store(true, std::memory_order_release);
        if (steps_.wakeWaiters) {
            steps_.wakeWaiters();
        }
        if (steps_.awaitSender && !steps_.awaitSender(senderGrace_)) {
            LOG_WARN("[Shutdown]   Step 1: Sender still busy after {}ms grace",
                     senderGrace_.count());
        }
    });

    runStep(2, "Stopping session", [this] {
        struct MarkClosed {
            PipelineFlags& flags;
            ~MarkClosed() {
                flags.sessionClosed.store(true, std::memory_order_release);
            }
        } markClosed{flags_};
        if (steps_.stopSession) {
            steps_.stopSession();
        }
    });

    runStep(3, "Waiting for pipeline tasks", steps_.awaitTasks);
    runStep(4, "Releasing signal handlers", steps_.releaseSignals);
    runStep(5, "Closing remote session", steps_.closeRemoteSession);

    state_.store(State::Stopped, std::memory_order_release);
    if (failedSteps_.load() > 0) {
        LOG_WARN("[Shutdown] Stopped with {} failed step(s)", failedSteps_.load());
    } else {
        LOG_INFO("[Shutdown] Stopped");
    }
    return true;
}

}  // namespace pipeline
}  // namespace live_asr
