#pragma once

#include "audio/pcm_reader.h"
#include "core/error_codes.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace live_asr {
namespace audio {

enum class CaptureStatus {
    XrunRecovered,  // overrun recovered, partial block discarded
    ShortRead,      // device returned fewer frames than requested
    ReadError,      // device read failed
    Failed,         // too many consecutive errors, capture thread exited
};

const char* captureStatusToString(CaptureStatus status);

// ErrorCode logged with a status; OK for conditions that are not errors
ErrorCode captureStatusErrorCode(CaptureStatus status);

/**
 * @brief Owns a PcmReader and a capture thread delivering fixed-size blocks.
 *
 * Each completed block of config.blockFrames frames is passed to the frame callback
 * exactly once, on the capture thread. Partial reads are accumulated, never
 * delivered. stop() joins the thread and closes the device; no callback runs after
 * it returns.
 */
class FrameSource {
   public:
    using FrameCallback = std::function<void(std::vector<std::uint8_t>&&)>;
    using StatusCallback = std::function<void(CaptureStatus, const std::string&)>;

    static constexpr int kMaxConsecutiveErrors = 10;

    FrameSource(std::unique_ptr<PcmReader> reader, CaptureConfig config);
    ~FrameSource();

    FrameSource(const FrameSource&) = delete;
    FrameSource& operator=(const FrameSource&) = delete;

    // Open the device and start the capture thread
    bool start(FrameCallback onFrame, StatusCallback onStatus = {});

    // Idempotent
    void stop();

    bool running() const {
        return running_.load(std::memory_order_acquire);
    }
    bool failed() const {
        return failed_.load(std::memory_order_acquire);
    }

    // Bytes per delivered block, valid after start()
    std::size_t blockBytes() const {
        return blockBytes_;
    }
    std::uint64_t blocksDelivered() const {
        return blocksDelivered_.load(std::memory_order_relaxed);
    }

   private:
    void captureLoop();
    void report(CaptureStatus status, const std::string& detail);

    std::unique_ptr<PcmReader> reader_;
    CaptureConfig config_;
    FrameCallback onFrame_;
    StatusCallback onStatus_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<std::uint64_t> blocksDelivered_{0};
    std::size_t blockBytes_{0};
    bool opened_{false};
};

}  // namespace audio
}  // namespace live_asr
