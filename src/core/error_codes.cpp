#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace live_asr {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Audio capture
    {ErrorCode::CAPTURE_DEVICE_NOT_FOUND, "CAPTURE_DEVICE_NOT_FOUND"},
    {ErrorCode::CAPTURE_OPEN_FAILED, "CAPTURE_OPEN_FAILED"},
    {ErrorCode::CAPTURE_FORMAT_NOT_SUPPORTED, "CAPTURE_FORMAT_NOT_SUPPORTED"},
    {ErrorCode::CAPTURE_XRUN_DETECTED, "CAPTURE_XRUN_DETECTED"},
    {ErrorCode::CAPTURE_READ_FAILED, "CAPTURE_READ_FAILED"},
    {ErrorCode::CAPTURE_QUEUE_OVERFLOW, "CAPTURE_QUEUE_OVERFLOW"},

    // Session / transport
    {ErrorCode::SESSION_CREATE_FAILED, "SESSION_CREATE_FAILED"},
    {ErrorCode::SESSION_CLOSE_FAILED, "SESSION_CLOSE_FAILED"},
    {ErrorCode::SESSION_NOT_STARTED, "SESSION_NOT_STARTED"},
    {ErrorCode::SESSION_STOPPED, "SESSION_STOPPED"},
    {ErrorCode::TRANSPORT_CONNECT_FAILED, "TRANSPORT_CONNECT_FAILED"},
    {ErrorCode::TRANSPORT_SEND_FAILED, "TRANSPORT_SEND_FAILED"},
    {ErrorCode::TRANSPORT_RECEIVE_FAILED, "TRANSPORT_RECEIVE_FAILED"},
    {ErrorCode::TRANSPORT_TIMEOUT, "TRANSPORT_TIMEOUT"},
    {ErrorCode::TRANSPORT_PROTOCOL_ERROR, "TRANSPORT_PROTOCOL_ERROR"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_INVALID_MODE, "VALIDATION_INVALID_MODE"},
    {ErrorCode::VALIDATION_MISSING_TOKEN, "VALIDATION_MISSING_TOKEN"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isCaptureError(code)) {
        return "audio_capture";
    }
    if (isTransportError(code)) {
        return "transport";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

TransportError::TransportError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(errorCodeToString(code)) + ": " + message), code_(code) {}

}  // namespace live_asr
