#pragma once

#include "audio/pcm_reader.h"

#include <alsa/asoundlib.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace live_asr {
namespace audio {

struct CaptureDeviceInfo {
    std::string name;
    std::string description;
};

/**
 * @brief Interleaved ALSA capture (RW access, blocking reads).
 */
class AlsaCapture : public PcmReader {
   public:
    enum class SampleFormat {
        S16_LE,
        S24_3LE,
        S32_LE,
    };

    AlsaCapture() = default;
    ~AlsaCapture() override;

    AlsaCapture(const AlsaCapture&) = delete;
    AlsaCapture& operator=(const AlsaCapture&) = delete;

    bool open(const CaptureConfig& config) override;
    int read(std::uint8_t* dst, std::size_t maxFrames) override;
    void close() override;
    std::size_t bytesPerFrame() const override {
        return frameBytes_;
    }
    std::string describe() const override;

    bool isOpen() const {
        return handle_ != nullptr;
    }
    unsigned int negotiatedRate() const {
        return rate_;
    }
    SampleFormat negotiatedFormat() const {
        return format_;
    }

    // Exposed for unit tests and CLI validation
    static snd_pcm_format_t toAlsaFormat(SampleFormat format);
    static std::optional<SampleFormat> formatForWidth(unsigned int sampleWidthBytes);
    static unsigned int sampleWidth(SampleFormat format);

    /**
     * @brief Compare what the device agreed to against the request.
     *
     * Chunk sizes and the session's audio format are derived from the configuration,
     * so any substitution of sample format or rate is a hard failure.
     *
     * @return Description of the mismatch, or std::nullopt if the device matches
     */
    static std::optional<std::string> checkNegotiated(const CaptureConfig& requested,
                                                      bool formatSupported,
                                                      unsigned int negotiatedRate);

   private:
    snd_pcm_t* handle_{nullptr};
    std::string device_;
    unsigned int rate_{0};
    unsigned int channels_{0};
    SampleFormat format_{SampleFormat::S16_LE};
    std::size_t frameBytes_{0};
};

// Capture-capable PCM names from ALSA's device hints
std::vector<CaptureDeviceInfo> listCaptureDevices();

// Resolve "auto" to the first capture-capable device; other names pass through
std::optional<std::string> selectCaptureDevice(const std::string& requested);

}  // namespace audio
}  // namespace live_asr
