#include "session/session_types.h"

#include <algorithm>
#include <cctype>

namespace live_asr {
namespace session {

std::optional<SessionMode> parseSessionMode(std::string_view value) {
    std::string lower{value};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "speed") {
        return SessionMode::Speed;
    }
    if (lower == "quality") {
        return SessionMode::Quality;
    }
    if (lower == "quality_v2") {
        return SessionMode::QualityV2;
    }
    return std::nullopt;
}

const char* sessionModeToString(SessionMode mode) {
    switch (mode) {
    case SessionMode::Speed:
        return "speed";
    case SessionMode::Quality:
        return "quality";
    case SessionMode::QualityV2:
        return "quality_v2";
    }
    return "speed";
}

}  // namespace session
}  // namespace live_asr
