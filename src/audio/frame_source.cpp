#include "audio/frame_source.h"

#include "logging/logger.h"

#include <algorithm>
#include <chrono>
#include <cstring>

namespace live_asr {
namespace audio {

namespace {
constexpr auto kErrorBackoff = std::chrono::milliseconds(10);
constexpr auto kIdleBackoff = std::chrono::milliseconds(2);
}  // namespace

const char* captureStatusToString(CaptureStatus status) {
    switch (status) {
    case CaptureStatus::XrunRecovered:
        return "xrun_recovered";
    case CaptureStatus::ShortRead:
        return "short_read";
    case CaptureStatus::ReadError:
        return "read_error";
    case CaptureStatus::Failed:
        return "failed";
    }
    return "unknown";
}

ErrorCode captureStatusErrorCode(CaptureStatus status) {
    switch (status) {
    case CaptureStatus::XrunRecovered:
        return ErrorCode::CAPTURE_XRUN_DETECTED;
    case CaptureStatus::ShortRead:
        return ErrorCode::OK;
    case CaptureStatus::ReadError:
    case CaptureStatus::Failed:
        return ErrorCode::CAPTURE_READ_FAILED;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

FrameSource::FrameSource(std::unique_ptr<PcmReader> reader, CaptureConfig config)
    : reader_(std::move(reader)), config_(std::move(config)) {}

FrameSource::~FrameSource() {
    stop();
}

bool FrameSource::start(FrameCallback onFrame, StatusCallback onStatus) {
    if (running_.load() || thread_.joinable()) {
        LOG_WARN("[FrameSource] start called while already running");
        return false;
    }
    if (!reader_ || config_.blockFrames == 0) {
        LOG_ERROR("[FrameSource] No reader or zero block size");
        return false;
    }
    if (!reader_->open(config_)) {
        LOG_ERROR("[FrameSource] Failed to open capture device {}", config_.device);
        return false;
    }
    opened_ = true;

    blockBytes_ = config_.blockFrames * reader_->bytesPerFrame();
    if (blockBytes_ == 0) {
        LOG_ERROR("[FrameSource] Device reported zero bytes per frame");
        reader_->close();
        opened_ = false;
        return false;
    }

    onFrame_ = std::move(onFrame);
    onStatus_ = std::move(onStatus);
    failed_ = false;
    running_ = true;
    thread_ = std::thread(&FrameSource::captureLoop, this);

    LOG_INFO("[FrameSource] Capture started: {} block={} frames ({} bytes)", reader_->describe(),
             config_.blockFrames, blockBytes_);
    return true;
}

void FrameSource::stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (opened_) {
        reader_->close();
        opened_ = false;
        LOG_INFO("[FrameSource] Capture released after {} blocks", blocksDelivered());
    }
}

void FrameSource::report(CaptureStatus status, const std::string& detail) {
    if (onStatus_) {
        onStatus_(status, detail);
    }
}

void FrameSource::captureLoop() {
    const std::size_t frameBytes = reader_->bytesPerFrame();
    std::vector<std::uint8_t> block(blockBytes_);
    std::size_t filledFrames = 0;
    int consecutiveErrors = 0;

    while (running_.load(std::memory_order_acquire)) {
        const std::size_t wanted = config_.blockFrames - filledFrames;
        const int rc = reader_->read(block.data() + filledFrames * frameBytes, wanted);

        if (rc == kReadXrunRecovered) {
            report(CaptureStatus::XrunRecovered,
                   "discarded " + std::to_string(filledFrames) + " buffered frames");
            filledFrames = 0;
            continue;
        }
        if (rc < 0) {
            ++consecutiveErrors;
            report(CaptureStatus::ReadError, std::string("read failed: ") + std::strerror(-rc));
            if (consecutiveErrors >= kMaxConsecutiveErrors) {
                failed_.store(true, std::memory_order_release);
                report(CaptureStatus::Failed,
                       std::to_string(consecutiveErrors) + " consecutive read errors");
                break;
            }
            std::this_thread::sleep_for(kErrorBackoff);
            continue;
        }
        consecutiveErrors = 0;

        if (rc == 0) {
            std::this_thread::sleep_for(kIdleBackoff);
            continue;
        }

        filledFrames += std::min(static_cast<std::size_t>(rc), wanted);
        if (filledFrames < config_.blockFrames) {
            report(CaptureStatus::ShortRead, std::to_string(rc) + "/" + std::to_string(wanted) +
                                                 " frames");
            continue;
        }

        std::vector<std::uint8_t> complete(blockBytes_);
        complete.swap(block);
        filledFrames = 0;
        blocksDelivered_.fetch_add(1, std::memory_order_relaxed);
        if (onFrame_) {
            onFrame_(std::move(complete));
        }
    }

    running_.store(false, std::memory_order_release);
}

}  // namespace audio
}  // namespace live_asr
