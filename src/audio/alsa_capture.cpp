#include "audio/alsa_capture.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <cstdlib>

namespace live_asr {
namespace audio {

namespace {

void logAlsaError(const char* what, int err) {
    LOG_ERROR("[AlsaCapture] {} failed: {}", what, snd_strerror(err));
}

std::string takeHint(void* hint, const char* id) {
    char* value = snd_device_name_get_hint(hint, id);
    if (!value) {
        return {};
    }
    std::string out{value};
    std::free(value);
    return out;
}

}  // namespace

AlsaCapture::~AlsaCapture() {
    close();
}

bool AlsaCapture::open(const CaptureConfig& config) {
    close();

    auto requested = formatForWidth(config.sampleWidthBytes);
    if (!requested) {
        LOG_ERROR("[AlsaCapture] Unsupported sample width: {} bytes", config.sampleWidthBytes);
        return false;
    }

    auto fail = [&](const char* what, int err) {
        logAlsaError(what, err);
        close();
        return false;
    };

    int rc = snd_pcm_open(&handle_, config.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (rc < 0) {
        logAlsaError("snd_pcm_open", rc);
        handle_ = nullptr;
        return false;
    }
    device_ = config.device;

    snd_pcm_hw_params_t* hwParams = nullptr;
    snd_pcm_hw_params_alloca(&hwParams);
    snd_pcm_hw_params_any(handle_, hwParams);

    rc = snd_pcm_hw_params_set_access(handle_, hwParams, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (rc < 0) {
        return fail("set_access", rc);
    }

    const bool formatSupported =
        snd_pcm_hw_params_test_format(handle_, hwParams, toAlsaFormat(*requested)) == 0;
    if (auto mismatch = checkNegotiated(config, formatSupported, config.sampleRate)) {
        LOG_ERROR("[AlsaCapture] {}: {} on {}",
                  errorCodeToString(ErrorCode::CAPTURE_FORMAT_NOT_SUPPORTED), *mismatch,
                  config.device);
        close();
        return false;
    }
    format_ = *requested;

    rc = snd_pcm_hw_params_set_format(handle_, hwParams, toAlsaFormat(format_));
    if (rc < 0) {
        return fail("set_format", rc);
    }

    rc = snd_pcm_hw_params_set_channels(handle_, hwParams, config.channels);
    if (rc < 0) {
        return fail("set_channels", rc);
    }
    channels_ = config.channels;

    unsigned int rate = config.sampleRate;
    rc = snd_pcm_hw_params_set_rate_near(handle_, hwParams, &rate, nullptr);
    if (rc < 0) {
        return fail("set_rate_near", rc);
    }
    // The session is told the configured rate; resampled or substituted audio is not accepted
    if (auto mismatch = checkNegotiated(config, true, rate)) {
        LOG_ERROR("[AlsaCapture] {}: {} on {}",
                  errorCodeToString(ErrorCode::CAPTURE_FORMAT_NOT_SUPPORTED), *mismatch,
                  config.device);
        close();
        return false;
    }
    rate_ = rate;

    snd_pcm_uframes_t period = static_cast<snd_pcm_uframes_t>(config.blockFrames);
    rc = snd_pcm_hw_params_set_period_size_near(handle_, hwParams, &period, nullptr);
    if (rc < 0) {
        return fail("set_period_size", rc);
    }

    rc = snd_pcm_hw_params(handle_, hwParams);
    if (rc < 0) {
        return fail("apply hw_params", rc);
    }

    rc = snd_pcm_prepare(handle_);
    if (rc < 0) {
        return fail("snd_pcm_prepare", rc);
    }

    frameBytes_ = static_cast<std::size_t>(channels_) * sampleWidth(format_);

    LOG_INFO("[AlsaCapture] opened {}", describe());
    LOG_DEBUG("[AlsaCapture] period_frames={} block_frames={}", period, config.blockFrames);
    return true;
}

int AlsaCapture::read(std::uint8_t* dst, std::size_t maxFrames) {
    if (!handle_) {
        LOG_WARN("[AlsaCapture] read called before open");
        return -EBADF;
    }

    const snd_pcm_sframes_t frames =
        snd_pcm_readi(handle_, dst, static_cast<snd_pcm_uframes_t>(maxFrames));
    if (frames == -EPIPE) {
        int rc = snd_pcm_prepare(handle_);
        if (rc < 0) {
            logAlsaError("snd_pcm_prepare after XRUN", rc);
            return rc;
        }
        return kReadXrunRecovered;
    }
    if (frames == -EAGAIN) {
        return 0;
    }
    if (frames == -ESTRPIPE) {
        int rc = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
        return rc < 0 ? rc : 0;
    }
    return static_cast<int>(frames);
}

void AlsaCapture::close() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
        LOG_INFO("[AlsaCapture] closed {}", device_);
    }
}

std::string AlsaCapture::describe() const {
    return "device=" + device_ + " rate=" + std::to_string(rate_) +
           " ch=" + std::to_string(channels_) +
           " fmt=" + snd_pcm_format_name(toAlsaFormat(format_));
}

snd_pcm_format_t AlsaCapture::toAlsaFormat(SampleFormat format) {
    switch (format) {
    case SampleFormat::S16_LE:
        return SND_PCM_FORMAT_S16_LE;
    case SampleFormat::S24_3LE:
        return SND_PCM_FORMAT_S24_3LE;
    case SampleFormat::S32_LE:
        return SND_PCM_FORMAT_S32_LE;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

std::optional<AlsaCapture::SampleFormat> AlsaCapture::formatForWidth(
    unsigned int sampleWidthBytes) {
    switch (sampleWidthBytes) {
    case 2:
        return SampleFormat::S16_LE;
    case 3:
        return SampleFormat::S24_3LE;
    case 4:
        return SampleFormat::S32_LE;
    default:
        return std::nullopt;
    }
}

unsigned int AlsaCapture::sampleWidth(SampleFormat format) {
    switch (format) {
    case SampleFormat::S16_LE:
        return 2;
    case SampleFormat::S24_3LE:
        return 3;
    case SampleFormat::S32_LE:
        return 4;
    }
    return 0;
}

std::optional<std::string> AlsaCapture::checkNegotiated(const CaptureConfig& requested,
                                                        bool formatSupported,
                                                        unsigned int negotiatedRate) {
    if (!formatSupported) {
        return std::to_string(requested.sampleWidthBytes * 8) + "-bit capture not supported";
    }
    if (negotiatedRate != requested.sampleRate) {
        return "requested " + std::to_string(requested.sampleRate) + " Hz, device offers " +
               std::to_string(negotiatedRate) + " Hz";
    }
    return std::nullopt;
}

std::vector<CaptureDeviceInfo> listCaptureDevices() {
    std::vector<CaptureDeviceInfo> devices;
    void** hints = nullptr;
    int rc = snd_device_name_hint(-1, "pcm", &hints);
    if (rc != 0 || hints == nullptr) {
        LOG_WARN("[AlsaCapture] snd_device_name_hint failed: {}", snd_strerror(rc));
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        std::string name = takeHint(*hint, "NAME");
        std::string ioid = takeHint(*hint, "IOID");
        if (name.empty()) {
            continue;
        }
        // A missing IOID means the PCM does both directions
        if (!ioid.empty() && ioid != "Input") {
            continue;
        }
        std::string desc = takeHint(*hint, "DESC");
        std::replace(desc.begin(), desc.end(), '\n', ' ');
        devices.push_back({name, desc});
    }
    snd_device_name_free_hint(hints);
    return devices;
}

std::optional<std::string> selectCaptureDevice(const std::string& requested) {
    if (requested != "auto") {
        return requested;
    }
    auto devices = listCaptureDevices();
    if (devices.empty()) {
        return std::nullopt;
    }
    return devices.front().name;
}

}  // namespace audio
}  // namespace live_asr
