#pragma once

#include "session/session_types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace live_asr {
namespace session {

/**
 * @brief One streaming transcription session.
 *
 * sendBytes() is called only by the chunk pump, readNext() only by the result
 * receiver; stop() may run concurrently with either and must make both return.
 * Transport failures are reported as TransportError.
 */
class TranscriptionSession {
   public:
    virtual ~TranscriptionSession() = default;

    virtual void start() = 0;
    virtual void sendBytes(const std::vector<std::uint8_t>& bytes) = 0;
    virtual void sendText(const std::string& text) = 0;

    /**
     * @brief Next result message.
     *
     * @param timeout std::nullopt uses the session's own idle window
     * @return std::nullopt if nothing arrived within the window or the session is stopped
     */
    virtual std::optional<std::string> readNext(
        std::optional<std::chrono::milliseconds> timeout) = 0;

    virtual void stop() = 0;

    // True once the remote side has announced the end of the stream
    virtual bool remoteEnded() const = 0;

    virtual const std::string& sessionId() const = 0;
    virtual const std::string& taskId() const = 0;
};

/**
 * @brief Control plane for sessions: create before streaming, close after.
 */
class SessionFactory {
   public:
    virtual ~SessionFactory() = default;

    virtual SessionCreateResult createSession(SessionMode mode, const std::string& credential) = 0;

    // Attach the streaming transport for a created session (not yet started)
    virtual std::unique_ptr<TranscriptionSession> connect(const SessionCreateResult& created) = 0;

    virtual SessionCloseResult closeSession(const std::string& taskId,
                                            const std::string& credential,
                                            std::optional<std::chrono::seconds> timeout) = 0;
};

}  // namespace session
}  // namespace live_asr
