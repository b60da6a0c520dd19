#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>

namespace live_asr {
namespace audio {

struct CaptureConfig {
    std::string device{"default"};
    unsigned int sampleRate{16000};
    unsigned int channels{1};
    unsigned int sampleWidthBytes{2};
    std::size_t blockFrames{3200};  // frames per callback block
};

// Read result codes below zero besides these are errno-style device errors
constexpr int kReadXrunRecovered = -EPIPE;

/**
 * @brief Blocking source of interleaved PCM frames.
 *
 * Implemented by AlsaCapture; tests substitute a scripted reader.
 */
class PcmReader {
   public:
    virtual ~PcmReader() = default;

    virtual bool open(const CaptureConfig& config) = 0;

    /**
     * @brief Read up to maxFrames interleaved frames into dst.
     *
     * @return frames read (may be fewer than requested), 0 if nothing was available,
     *         kReadXrunRecovered after an overrun was recovered, other negatives on error
     */
    virtual int read(std::uint8_t* dst, std::size_t maxFrames) = 0;

    virtual void close() = 0;

    // Bytes per interleaved frame as negotiated by open()
    virtual std::size_t bytesPerFrame() const = 0;

    virtual std::string describe() const = 0;
};

}  // namespace audio
}  // namespace live_asr
