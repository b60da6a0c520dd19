#ifndef LIVE_ASR_ERROR_CODES_H
#define LIVE_ASR_ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace live_asr {

/**
 * @brief Error codes for the streaming bridge.
 *
 * Categories use upper 4 bits of the 16-bit code (0xF000 mask):
 * - 0x1xxx: Audio capture
 * - 0x2xxx: Session / transport
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio capture (0x1000)
    CAPTURE_DEVICE_NOT_FOUND = 0x1001,
    CAPTURE_OPEN_FAILED = 0x1002,
    CAPTURE_FORMAT_NOT_SUPPORTED = 0x1003,
    CAPTURE_XRUN_DETECTED = 0x1004,
    CAPTURE_READ_FAILED = 0x1005,
    CAPTURE_QUEUE_OVERFLOW = 0x1006,

    // Session / transport (0x2000)
    SESSION_CREATE_FAILED = 0x2001,
    SESSION_CLOSE_FAILED = 0x2002,
    SESSION_NOT_STARTED = 0x2003,
    SESSION_STOPPED = 0x2004,
    TRANSPORT_CONNECT_FAILED = 0x2005,
    TRANSPORT_SEND_FAILED = 0x2006,
    TRANSPORT_RECEIVE_FAILED = 0x2007,
    TRANSPORT_TIMEOUT = 0x2008,
    TRANSPORT_PROTOCOL_ERROR = 0x2009,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_MODE = 0x5002,
    VALIDATION_MISSING_TOKEN = 0x5003,
    VALIDATION_FILE_NOT_FOUND = 0x5004,

    // Internal (0xF000) - Reserved for fallback
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "TRANSPORT_SEND_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "transport"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x2006").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isCaptureError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isTransportError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Failure on the session channel (send, receive or control request).
 *
 * Never retried by the pipeline: the task that observes it exits and the
 * shutdown sequence runs.
 */
class TransportError : public std::runtime_error {
   public:
    TransportError(ErrorCode code, const std::string& message);

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

}  // namespace live_asr

#endif  // LIVE_ASR_ERROR_CODES_H
