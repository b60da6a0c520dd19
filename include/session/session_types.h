#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace live_asr {
namespace session {

// Recognition model requested when a streaming session is created
enum class SessionMode {
    Speed,
    Quality,
    QualityV2,
};

// Case-insensitive: "speed", "quality", "quality_v2"
std::optional<SessionMode> parseSessionMode(std::string_view value);

const char* sessionModeToString(SessionMode mode);

struct SessionCreateResult {
    std::string taskId;
    std::string sessionId;
    std::string usageId;
    std::int64_t maxTimeSeconds = 0;  // streaming time granted by the remote side
};

struct SessionCloseResult {
    std::string status;
    std::optional<std::int64_t> durationSeconds;
    std::optional<int> errorCode;
    std::optional<std::string> message;
};

}  // namespace session
}  // namespace live_asr
