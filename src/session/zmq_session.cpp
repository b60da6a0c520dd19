#include "session/zmq_session.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

namespace live_asr {
namespace session {

using json = nlohmann::json;

namespace wire {

namespace {

json parseReply(const std::string& text, ErrorCode failureCode) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw TransportError(ErrorCode::TRANSPORT_PROTOCOL_ERROR,
                             std::string("invalid JSON reply: ") + e.what());
    }
    if (!j.is_object() || !j.contains("status") || !j["status"].is_string()) {
        throw TransportError(ErrorCode::TRANSPORT_PROTOCOL_ERROR, "reply has no status");
    }
    if (j["status"].get<std::string>() != "ok") {
        std::string message = j.value("message", std::string("request rejected"));
        if (j.contains("error_code")) {
            message += " (error_code=" + j["error_code"].dump() + ")";
        }
        throw TransportError(failureCode, message);
    }
    if (!j.contains("data") || !j["data"].is_object()) {
        throw TransportError(ErrorCode::TRANSPORT_PROTOCOL_ERROR, "reply has no data object");
    }
    return j["data"];
}

}  // namespace

std::string buildCreateSessionRequest(SessionMode mode, const std::string& token) {
    json j;
    j["cmd"] = "CREATE_SESSION";
    j["params"]["mode"] = sessionModeToString(mode);
    j["params"]["token"] = token;
    return j.dump();
}

std::string buildCloseSessionRequest(const std::string& taskId, const std::string& token,
                                     std::optional<std::chrono::seconds> timeout) {
    json j;
    j["cmd"] = "CLOSE_SESSION";
    j["params"]["task_id"] = taskId;
    j["params"]["token"] = token;
    if (timeout) {
        j["params"]["timeout_seconds"] = timeout->count();
    } else {
        j["params"]["timeout_seconds"] = nullptr;
    }
    return j.dump();
}

SessionCreateResult parseCreateSessionResponse(const std::string& text) {
    json data = parseReply(text, ErrorCode::SESSION_CREATE_FAILED);
    SessionCreateResult result;
    try {
        result.taskId = data.at("task_id").get<std::string>();
        result.sessionId = data.at("session_id").get<std::string>();
        result.usageId = data.value("usage_id", std::string());
        result.maxTimeSeconds = data.value("max_time", static_cast<std::int64_t>(0));
    } catch (const json::exception& e) {
        throw TransportError(ErrorCode::TRANSPORT_PROTOCOL_ERROR,
                             std::string("malformed CREATE_SESSION reply: ") + e.what());
    }
    if (result.sessionId.empty() || result.taskId.empty()) {
        throw TransportError(ErrorCode::TRANSPORT_PROTOCOL_ERROR,
                             "CREATE_SESSION reply has empty ids");
    }
    return result;
}

SessionCloseResult parseCloseSessionResponse(const std::string& text) {
    json data = parseReply(text, ErrorCode::SESSION_CLOSE_FAILED);
    SessionCloseResult result;
    try {
        result.status = data.value("status", std::string("closed"));
        if (data.contains("duration") && data["duration"].is_number()) {
            result.durationSeconds = data["duration"].get<std::int64_t>();
        }
        if (data.contains("error_code") && data["error_code"].is_number()) {
            result.errorCode = data["error_code"].get<int>();
        }
        if (data.contains("message") && data["message"].is_string()) {
            result.message = data["message"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw TransportError(ErrorCode::TRANSPORT_PROTOCOL_ERROR,
                             std::string("malformed CLOSE_SESSION reply: ") + e.what());
    }
    return result;
}

bool isSessionEndedMessage(const std::string& payload) {
    if (payload.empty() || payload.front() != '{') {
        return false;
    }
    try {
        auto j = json::parse(payload);
        return j.is_object() && j.value("type", std::string()) == "session_ended";
    } catch (const json::exception&) {
        return false;
    }
}

}  // namespace wire

// ============================================================
// ZmqSession
// ============================================================

struct ZmqSession::Sockets {
    std::unique_ptr<zmq::socket_t> push;
    std::unique_ptr<zmq::socket_t> sub;
};

ZmqSession::ZmqSession(std::shared_ptr<zmq::context_t> context, AppConfig::SessionConfig config,
                       SessionCreateResult created)
    : context_(std::move(context)),
      config_(std::move(config)),
      created_(std::move(created)),
      sockets_(std::make_unique<Sockets>()) {}

ZmqSession::~ZmqSession() {
    try {
        stop();
    } catch (const std::exception& e) {
        LOG_WARN("[ZmqSession] stop during destruction failed: {}", e.what());
    }
}

void ZmqSession::start() {
    if (stopped_.load()) {
        throw TransportError(ErrorCode::SESSION_STOPPED, "start after stop");
    }
    if (started_.load()) {
        return;
    }

    std::lock_guard<std::mutex> writeLock(writeMutex_);
    std::lock_guard<std::mutex> readLock(readMutex_);
    try {
        sockets_->push = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::push);
        sockets_->push->set(zmq::sockopt::linger, 0);
        sockets_->push->set(zmq::sockopt::sndtimeo, config_.sendTimeoutMs);
        sockets_->push->connect(config_.audioEndpoint);

        sockets_->sub = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);
        sockets_->sub->set(zmq::sockopt::linger, 0);
        sockets_->sub->set(zmq::sockopt::subscribe, created_.sessionId);
        sockets_->sub->set(zmq::sockopt::rcvtimeo, config_.idleWindowMs);
        currentRcvTimeoutMs_ = config_.idleWindowMs;
        sockets_->sub->connect(config_.resultEndpoint);
    } catch (const zmq::error_t& e) {
        sockets_->push.reset();
        sockets_->sub.reset();
        throw TransportError(ErrorCode::TRANSPORT_CONNECT_FAILED, e.what());
    }

    json hello;
    hello["task_id"] = created_.taskId;
    const std::string payload = hello.dump();
    sendFrameLocked(kKindStart, payload.data(), payload.size());

    started_.store(true);
    LOG_INFO("[ZmqSession] Session {} started (audio={} results={})", created_.sessionId,
             config_.audioEndpoint, config_.resultEndpoint);
}

void ZmqSession::checkWritable() const {
    if (stopped_.load(std::memory_order_acquire)) {
        throw TransportError(ErrorCode::SESSION_STOPPED, "session " + created_.sessionId);
    }
    if (!started_.load(std::memory_order_acquire)) {
        throw TransportError(ErrorCode::SESSION_NOT_STARTED, "session " + created_.sessionId);
    }
}

void ZmqSession::sendFrameLocked(const char* kind, const void* data, std::size_t size) {
    if (!sockets_->push) {
        throw TransportError(ErrorCode::SESSION_STOPPED, "audio socket closed");
    }
    try {
        auto& push = *sockets_->push;
        if (!push.send(zmq::buffer(created_.sessionId), zmq::send_flags::sndmore)) {
            throw TransportError(ErrorCode::TRANSPORT_TIMEOUT,
                                 std::string("send timed out (") + kind + ")");
        }
        push.send(zmq::buffer(std::string(kind)), zmq::send_flags::sndmore);
        push.send(zmq::const_buffer(data, size), zmq::send_flags::none);
    } catch (const zmq::error_t& e) {
        throw TransportError(ErrorCode::TRANSPORT_SEND_FAILED, e.what());
    }
}

void ZmqSession::sendBytes(const std::vector<std::uint8_t>& bytes) {
    checkWritable();
    std::lock_guard<std::mutex> lock(writeMutex_);
    checkWritable();
    sendFrameLocked(kKindAudio, bytes.data(), bytes.size());
}

void ZmqSession::sendText(const std::string& text) {
    checkWritable();
    std::lock_guard<std::mutex> lock(writeMutex_);
    checkWritable();
    sendFrameLocked(kKindText, text.data(), text.size());
}

std::optional<std::string> ZmqSession::readNext(std::optional<std::chrono::milliseconds> timeout) {
    if (!started_.load() || stopped_.load()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(readMutex_);
    if (stopped_.load() || !sockets_->sub) {
        return std::nullopt;
    }

    auto& sub = *sockets_->sub;
    try {
        const int wantedTimeout =
            timeout ? static_cast<int>(timeout->count()) : config_.idleWindowMs;
        if (wantedTimeout != currentRcvTimeoutMs_) {
            sub.set(zmq::sockopt::rcvtimeo, wantedTimeout);
            currentRcvTimeoutMs_ = wantedTimeout;
        }

        zmq::message_t topic;
        if (!sub.recv(topic, zmq::recv_flags::none)) {
            return std::nullopt;
        }
        if (!topic.more()) {
            LOG_WARN("[ZmqSession] Ignoring single-part result message");
            return std::nullopt;
        }
        zmq::message_t body;
        if (!sub.recv(body, zmq::recv_flags::none)) {
            return std::nullopt;
        }
        while (body.more()) {
            zmq::message_t extra;
            if (!sub.recv(extra, zmq::recv_flags::none)) {
                break;
            }
            body.swap(extra);
        }

        std::string payload = body.to_string();
        if (wire::isSessionEndedMessage(payload)) {
            remoteEnded_.store(true, std::memory_order_release);
            LOG_INFO("[ZmqSession] Session {} ended by remote", created_.sessionId);
            return std::nullopt;
        }
        return payload;
    } catch (const zmq::error_t& e) {
        if (e.num() == ETERM || stopped_.load()) {
            return std::nullopt;
        }
        throw TransportError(ErrorCode::TRANSPORT_RECEIVE_FAILED, e.what());
    }
}

void ZmqSession::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    if (!started_.load()) {
        return;
    }

    std::optional<TransportError> failure;
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        try {
            sendFrameLocked(kKindStop, nullptr, 0);
        } catch (const TransportError& e) {
            failure = e;
        }
        sockets_->push.reset();
    }
    {
        std::lock_guard<std::mutex> lock(readMutex_);
        sockets_->sub.reset();
    }
    LOG_INFO("[ZmqSession] Session {} stopped", created_.sessionId);

    if (failure) {
        throw *failure;
    }
}

// ============================================================
// ZmqSessionFactory
// ============================================================

ZmqSessionFactory::ZmqSessionFactory(AppConfig::SessionConfig config)
    : config_(std::move(config)), context_(std::make_shared<zmq::context_t>(1)) {}

ZmqSessionFactory::~ZmqSessionFactory() = default;

std::string ZmqSessionFactory::request(const std::string& payload,
                                       std::chrono::milliseconds timeout) {
    try {
        zmq::socket_t req(*context_, zmq::socket_type::req);
        req.set(zmq::sockopt::linger, 0);
        req.set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout.count()));
        req.set(zmq::sockopt::sndtimeo, static_cast<int>(timeout.count()));
        req.connect(config_.controlEndpoint);

        if (!req.send(zmq::buffer(payload), zmq::send_flags::none)) {
            throw TransportError(ErrorCode::TRANSPORT_TIMEOUT,
                                 "control request not accepted by " + config_.controlEndpoint);
        }
        zmq::message_t reply;
        if (!req.recv(reply, zmq::recv_flags::none)) {
            throw TransportError(ErrorCode::TRANSPORT_TIMEOUT,
                                 "no reply from " + config_.controlEndpoint + " within " +
                                     std::to_string(timeout.count()) + "ms");
        }
        return reply.to_string();
    } catch (const zmq::error_t& e) {
        throw TransportError(ErrorCode::TRANSPORT_CONNECT_FAILED, e.what());
    }
}

SessionCreateResult ZmqSessionFactory::createSession(SessionMode mode,
                                                     const std::string& credential) {
    LOG_DEBUG("[ZmqSessionFactory] CREATE_SESSION mode={} via {}", sessionModeToString(mode),
              config_.controlEndpoint);
    const auto reply = request(wire::buildCreateSessionRequest(mode, credential),
                               std::chrono::milliseconds(config_.requestTimeoutMs));
    return wire::parseCreateSessionResponse(reply);
}

std::unique_ptr<TranscriptionSession> ZmqSessionFactory::connect(
    const SessionCreateResult& created) {
    return std::make_unique<ZmqSession>(context_, config_, created);
}

SessionCloseResult ZmqSessionFactory::closeSession(const std::string& taskId,
                                                   const std::string& credential,
                                                   std::optional<std::chrono::seconds> timeout) {
    LOG_DEBUG("[ZmqSessionFactory] CLOSE_SESSION task_id={}", taskId);
    std::chrono::milliseconds wait(config_.requestTimeoutMs);
    if (timeout) {
        wait = std::max(wait, std::chrono::milliseconds(*timeout));
    }
    const auto reply = request(wire::buildCloseSessionRequest(taskId, credential, timeout), wait);
    return wire::parseCloseSessionResponse(reply);
}

}  // namespace session
}  // namespace live_asr
