#include "pipeline/streaming_pipeline.h"

#include "audio/frame_source.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "pipeline/bounded_channel.h"
#include "pipeline/result_receiver.h"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace live_asr {
namespace pipeline {

namespace {

constexpr auto kSupervisorTick = std::chrono::milliseconds(50);
constexpr auto kCapturePoll = std::chrono::milliseconds(50);

void logCaptureStatus(audio::CaptureStatus status, const std::string& detail) {
    const char* code = errorCodeToString(audio::captureStatusErrorCode(status));
    switch (status) {
    case audio::CaptureStatus::XrunRecovered:
        LOG_WARN("[Capture] {}: XRUN recovered: {}", code, detail);
        break;
    case audio::CaptureStatus::ShortRead:
        LOG_EVERY_N(DEBUG, 100, "[Capture] Short read: {}", detail);
        break;
    case audio::CaptureStatus::ReadError:
        LOG_ERROR("[Capture] {}: {}", code, detail);
        break;
    case audio::CaptureStatus::Failed:
        LOG_ERROR("[Capture] {}: giving up: {}", code, detail);
        break;
    }
}

}  // namespace

StreamingPipeline::StreamingPipeline(AppConfig config, Dependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
    if (!deps_.factory || !deps_.sink || !deps_.makeReader) {
        throw std::invalid_argument("StreamingPipeline requires factory, sink and reader");
    }
}

void StreamingPipeline::closeRemoteSession(const std::string& taskId) {
    auto result = deps_.factory->closeSession(taskId, config_.session.token, std::nullopt);
    if (result.durationSeconds) {
        LOG_INFO("[Pipeline] Remote session {} closed: status={} duration={}s", taskId,
                 result.status, *result.durationSeconds);
    } else {
        LOG_INFO("[Pipeline] Remote session {} closed: status={}", taskId, result.status);
    }
    if (result.errorCode || result.message) {
        LOG_WARN("[Pipeline] Close reported error_code={} message={}",
                 result.errorCode.value_or(0), result.message.value_or(""));
    }
}

int StreamingPipeline::run() {
    summary_ = RunSummary{};
    summary_.exitCode = kExitFailure;

    const auto& sessionConfig = config_.session;
    auto mode = session::parseSessionMode(sessionConfig.mode);
    if (!mode) {
        LOG_ERROR("[Pipeline] {}: '{}'", errorCodeToString(ErrorCode::VALIDATION_INVALID_MODE),
                  sessionConfig.mode);
        return summary_.exitCode;
    }
    if (sessionConfig.token.empty()) {
        LOG_ERROR("[Pipeline] {}: set LIVE_ASR_TOKEN or session.token",
                  errorCodeToString(ErrorCode::VALIDATION_MISSING_TOKEN));
        return summary_.exitCode;
    }

    LOG_INFO("[Pipeline] Creating {} session (token {})", session::sessionModeToString(*mode),
             redactToken(sessionConfig.token));

    session::SessionCreateResult created;
    try {
        created = deps_.factory->createSession(*mode, sessionConfig.token);
    } catch (const std::exception& e) {
        LOG_ERROR("[Pipeline] Session creation failed: {}", e.what());
        return summary_.exitCode;
    }
    LOG_INFO("[Pipeline] Session created: task_id={} session_id={} max_time={}s", created.taskId,
             created.sessionId, created.maxTimeSeconds);

    std::unique_ptr<session::TranscriptionSession> session;
    try {
        session = deps_.factory->connect(created);
        session->start();
    } catch (const std::exception& e) {
        LOG_ERROR("[Pipeline] Session start failed: {}", e.what());
        try {
            closeRemoteSession(created.taskId);
        } catch (const std::exception& closeError) {
            LOG_WARN("[Pipeline] Remote close after failed start also failed: {}",
                     closeError.what());
        }
        return summary_.exitCode;
    }

    PipelineFlags flags;
    BoundedChannel channel(config_.pipeline.queueCapacity);
    ChunkPump pump(channel, *session, flags, chunkSizeBytes(config_.audio),
                   chunkDuration(config_.audio));
    ResultReceiver receiver(*session, *deps_.sink, flags,
                            std::chrono::milliseconds(config_.pipeline.receiverIdleRetryMs));

    audio::CaptureConfig capture;
    capture.device = config_.audio.device;
    capture.sampleRate = config_.audio.sampleRate;
    capture.channels = config_.audio.channels;
    capture.sampleWidthBytes = config_.audio.sampleWidthBytes;
    capture.blockFrames = blockFrames(config_.audio);

    signals::InterruptRegistration registration;
    if (deps_.installSignalHandlers && !registration.install()) {
        LOG_WARN("[Pipeline] Running without SIGINT/SIGTERM handlers");
    }

    std::mutex taskMutex;
    std::condition_variable taskCv;
    bool senderDone = false;
    std::vector<std::thread> tasks;

    ShutdownCoordinator::Steps steps;
    steps.wakeWaiters = [&] {
        channel.wakeAll();
        receiver.wake();
    };
    steps.awaitSender = [&](std::chrono::milliseconds grace) {
        std::unique_lock<std::mutex> lock(taskMutex);
        return taskCv.wait_for(lock, grace, [&] { return senderDone; });
    };
    steps.stopSession = [&] { session->stop(); };
    steps.awaitTasks = [&] {
        for (auto& task : tasks) {
            if (task.joinable()) {
                task.join();
            }
        }
    };
    steps.releaseSignals = [&] { registration.release(); };
    steps.closeRemoteSession = [&] { closeRemoteSession(created.taskId); };

    ShutdownCoordinator coordinator(flags, std::move(steps), senderGrace(config_));

    auto launch = [&](const char* name, std::function<void()> body,
                      std::function<StopReason()> exitReason, bool isSender) {
        tasks.emplace_back([&, name, body = std::move(body), exitReason = std::move(exitReason),
                            isSender] {
            StopReason reason = StopReason::TaskExited;
            std::string detail;
            try {
                body();
                reason = exitReason();
                detail = std::string(name) + " finished";
            } catch (const std::exception& e) {
                LOG_ERROR("[Pipeline] {} task failed: {}", name, e.what());
                reason = StopReason::TaskFailure;
                detail = std::string(name) + ": " + e.what();
            }
            if (isSender) {
                {
                    std::lock_guard<std::mutex> lock(taskMutex);
                    senderDone = true;
                }
                taskCv.notify_all();
            }
            coordinator.requestStop(reason, detail);
        });
    };

    try {
        launch(
            "capture",
            [&] {
                audio::FrameSource source(deps_.makeReader(), capture);
                const bool started = source.start(
                    [&channel](std::vector<std::uint8_t>&& frame) { channel.push(std::move(frame)); },
                    logCaptureStatus);
                if (!started) {
                    throw std::runtime_error(
                        std::string(errorCodeToString(ErrorCode::CAPTURE_OPEN_FAILED)) +
                        ": cannot open " + capture.device);
                }
                while (!flags.isCancelled() && source.running()) {
                    std::this_thread::sleep_for(kCapturePoll);
                }
                const bool failed = source.failed();
                source.stop();
                summary_.blocksCaptured = source.blocksDelivered();
                if (failed) {
                    throw std::runtime_error(
                        std::string(errorCodeToString(ErrorCode::CAPTURE_READ_FAILED)) +
                        ": capture device stopped delivering audio");
                }
            },
            [] { return StopReason::TaskExited; }, false);

        launch(
            "pump", [&] { pump.run(); }, [] { return StopReason::TaskExited; }, true);

        launch(
            "receiver", [&] { receiver.run(); },
            [&] {
                return receiver.endedByRemote() ? StopReason::StreamEnded : StopReason::TaskExited;
            },
            false);
    } catch (const std::system_error& e) {
        LOG_ERROR("[Pipeline] Failed to start pipeline threads: {}", e.what());
        coordinator.requestStop(StopReason::TaskFailure, e.what());
        {
            std::lock_guard<std::mutex> lock(taskMutex);
            senderDone = true;
        }
    }

    const auto streamStart = std::chrono::steady_clock::now();
    const auto maxStreaming = std::chrono::seconds(created.maxTimeSeconds);

    LOG_INFO("[Pipeline] Streaming (Ctrl+C to stop)");
    while (!coordinator.waitForStopRequest(kSupervisorTick)) {
        if (deps_.signalState) {
            if (int sig = signals::takePendingInterrupt(*deps_.signalState)) {
                coordinator.requestStop(StopReason::Interrupt,
                                        "received signal " + std::to_string(sig));
            }
        }
        if (created.maxTimeSeconds > 0 &&
            std::chrono::steady_clock::now() - streamStart >= maxStreaming) {
            coordinator.requestStop(StopReason::StreamEnded, "session time limit reached");
        }
    }

    coordinator.runStopSequence();

    summary_.pump = pump.stats();
    summary_.framesDropped = channel.dropCount();
    summary_.messagesReceived = receiver.messagesReceived();
    summary_.reason = coordinator.reason();
    summary_.failedShutdownSteps = coordinator.failedSteps();
    summary_.exitCode =
        summary_.reason == StopReason::TaskFailure ? kExitFailure : kExitOk;

    LOG_INFO("[Pipeline] Run finished ({}): captured={} dropped={} sent={} bytes results={}",
             stopReasonToString(summary_.reason.value_or(StopReason::Requested)),
             summary_.blocksCaptured, summary_.framesDropped, summary_.pump.bytesSent,
             summary_.messagesReceived);
    return summary_.exitCode;
}

}  // namespace pipeline
}  // namespace live_asr
