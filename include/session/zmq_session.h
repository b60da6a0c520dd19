#pragma once

#include "core/config_loader.h"
#include "session/transcription_session.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace zmq {
class context_t;
}  // namespace zmq

namespace live_asr {
namespace session {

// Message kinds on the audio (PUSH) channel: [session_id][kind][payload]
constexpr const char* kKindStart = "start";
constexpr const char* kKindAudio = "audio";
constexpr const char* kKindText = "text";
constexpr const char* kKindStop = "stop";

// JSON helpers for the control channel (exposed for testing)
namespace wire {

// {"cmd":"CREATE_SESSION","params":{"mode":...,"token":...}}
std::string buildCreateSessionRequest(SessionMode mode, const std::string& token);

// {"cmd":"CLOSE_SESSION","params":{"task_id":...,"token":...,"timeout_seconds":n|null}}
std::string buildCloseSessionRequest(const std::string& taskId, const std::string& token,
                                     std::optional<std::chrono::seconds> timeout);

// Throws TransportError for error replies and malformed JSON
SessionCreateResult parseCreateSessionResponse(const std::string& json);
SessionCloseResult parseCloseSessionResponse(const std::string& json);

// {"type":"session_ended"} marks the end of the result stream
bool isSessionEndedMessage(const std::string& payload);

}  // namespace wire

/**
 * @brief TranscriptionSession over ZeroMQ.
 *
 * Audio and text go out on a PUSH socket, results come back on a SUB socket
 * filtered by session_id. The two sockets are guarded by separate mutexes so the
 * sender and the receiver never contend; stop() takes both.
 */
class ZmqSession : public TranscriptionSession {
   public:
    ZmqSession(std::shared_ptr<zmq::context_t> context, AppConfig::SessionConfig config,
               SessionCreateResult created);
    ~ZmqSession() override;

    ZmqSession(const ZmqSession&) = delete;
    ZmqSession& operator=(const ZmqSession&) = delete;

    void start() override;
    void sendBytes(const std::vector<std::uint8_t>& bytes) override;
    void sendText(const std::string& text) override;
    std::optional<std::string> readNext(
        std::optional<std::chrono::milliseconds> timeout) override;
    void stop() override;

    bool remoteEnded() const override {
        return remoteEnded_.load(std::memory_order_acquire);
    }
    const std::string& sessionId() const override {
        return created_.sessionId;
    }
    const std::string& taskId() const override {
        return created_.taskId;
    }

   private:
    struct Sockets;

    void sendFrameLocked(const char* kind, const void* data, std::size_t size);
    void checkWritable() const;

    std::shared_ptr<zmq::context_t> context_;
    AppConfig::SessionConfig config_;
    SessionCreateResult created_;
    std::unique_ptr<Sockets> sockets_;

    std::mutex writeMutex_;
    std::mutex readMutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> remoteEnded_{false};
    int currentRcvTimeoutMs_ = -1;
};

/**
 * @brief Control-plane client: CREATE_SESSION / CLOSE_SESSION over REQ/REP.
 *
 * Each request uses a fresh REQ socket so a timed-out request cannot wedge the
 * REQ state machine.
 */
class ZmqSessionFactory : public SessionFactory {
   public:
    explicit ZmqSessionFactory(AppConfig::SessionConfig config);
    ~ZmqSessionFactory() override;

    SessionCreateResult createSession(SessionMode mode, const std::string& credential) override;
    std::unique_ptr<TranscriptionSession> connect(const SessionCreateResult& created) override;
    SessionCloseResult closeSession(const std::string& taskId, const std::string& credential,
                                    std::optional<std::chrono::seconds> timeout) override;

   private:
    std::string request(const std::string& payload, std::chrono::milliseconds timeout);

    AppConfig::SessionConfig config_;
    std::shared_ptr<zmq::context_t> context_;
};

}  // namespace session
}  // namespace live_asr
