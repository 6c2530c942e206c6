#include "audio/PortAudioInput.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <utility>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

namespace {

#ifdef HAS_PORTAUDIO

// One opened PortAudio input stream. Owns the PaStream handle and closes
// it on destruction.
class PortAudioStream : public IAudioInput::Stream {
public:
    PortAudioStream(int channelCount,
                    IAudioInput::DataCallback onData,
                    IAudioInput::ErrorCallback onError)
        : channelCount_(channelCount)
        , onData_(std::move(onData))
        , onError_(std::move(onError)) {}

    ~PortAudioStream() override {
        if (!stream_) return;
        stopping_ = true;
        if (Pa_IsStreamActive(stream_) == 1) {
            PaError abortErr = Pa_AbortStream(stream_);
            if (abortErr != paNoError)
                spdlog::warn("Pa_AbortStream failed: {}", Pa_GetErrorText(abortErr));
        }
        PaError err = Pa_CloseStream(stream_);
        if (err != paNoError)
            spdlog::warn("Pa_CloseStream failed: {}", Pa_GetErrorText(err));
        stream_ = nullptr;
        if (overflows_ > 0)
            spdlog::debug("Input stream closed after {} overflow(s)",
                          overflows_.load());
    }

    PaStream** handle() { return &stream_; }

    AudioStatus start() override {
        if (!stream_)
            return AudioStatus::failure(AudioError::NotInitialized,
                                        "stream is not open");
        stopping_ = false;
        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) {
            return AudioStatus::failure(
                PortAudioInput::classifyError(err, hostApiType(), hostErrorCode()),
                std::string("Pa_StartStream: ") + Pa_GetErrorText(err));
        }
        return AudioStatus::success();
    }

    AudioStatus stop() override {
        if (!stream_)
            return AudioStatus::success();
        stopping_ = true;
        if (Pa_IsStreamStopped(stream_) == 1)
            return AudioStatus::success();
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            return AudioStatus::failure(
                PortAudioInput::classifyError(err, hostApiType(), hostErrorCode()),
                std::string("Pa_StopStream: ") + Pa_GetErrorText(err));
        }
        return AudioStatus::success();
    }

    bool isActive() const override {
        return stream_ && Pa_IsStreamActive(stream_) == 1;
    }

    static int paCallback(const void* input, void* /*output*/,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* /*timeInfo*/,
                          PaStreamCallbackFlags statusFlags,
                          void* userData) {
        auto* self = static_cast<PortAudioStream*>(userData);
        if (statusFlags & paInputOverflow)
            self->overflows_.fetch_add(1, std::memory_order_relaxed);
        if (input && self->onData_) {
            self->onData_(static_cast<const float*>(input),
                          self->channelCount_,
                          static_cast<int>(frameCount));
        }
        return paContinue;
    }

    // Runs when the stream becomes inactive. Anything other than our own
    // stop() means the host pulled the device out from under us.
    static void paFinished(void* userData) {
        auto* self = static_cast<PortAudioStream*>(userData);
        if (!self->stopping_ && self->onError_)
            self->onError_("input stream finished unexpectedly");
    }

private:
    static int hostApiType() {
        const PaHostErrorInfo* info = Pa_GetLastHostErrorInfo();
        return info ? static_cast<int>(info->hostApiType) : -1;
    }

    static long hostErrorCode() {
        const PaHostErrorInfo* info = Pa_GetLastHostErrorInfo();
        return info ? info->errorCode : 0;
    }

    PaStream*                  stream_ = nullptr;
    int                        channelCount_;
    IAudioInput::DataCallback  onData_;
    IAudioInput::ErrorCallback onError_;
    std::atomic<bool>          stopping_{false};
    std::atomic<unsigned long> overflows_{0};
};

#endif

} // namespace

PortAudioInput::PortAudioInput() {
#ifdef HAS_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        paInitialized_ = true;
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
#endif
}

PortAudioInput::~PortAudioInput() {
#ifdef HAS_PORTAUDIO
    if (paInitialized_)
        Pa_Terminate();
#endif
}

AudioError PortAudioInput::classifyError(int paError, int hostApiType,
                                         long hostErrorCode) {
#ifdef HAS_PORTAUDIO
    switch (paError) {
        case paNoError:
            return AudioError::None;
        case paDeviceUnavailable:
            return AudioError::DeviceBusy;
        case paInvalidDevice:
            return AudioError::NoDevice;
        case paInvalidChannelCount:
        case paInvalidSampleRate:
        case paSampleFormatNotSupported:
        case paBadIODeviceCombination:
            return AudioError::InvalidConfig;
        case paNotInitialized:
            return AudioError::NotInitialized;
        case paUnanticipatedHostError:
            // ALSA and OSS hand back negative errno values
            if (hostApiType == paALSA || hostApiType == paOSS)
                return classifyHostErrno(hostErrorCode);
            return AudioError::HostError;
        default:
            return AudioError::HostError;
    }
#else
    (void)hostApiType;
    (void)hostErrorCode;
    return paError == 0 ? AudioError::None : AudioError::NotInitialized;
#endif
}

AudioStatus PortAudioInput::statusFromPa(int paError,
                                         const std::string& context) const {
#ifdef HAS_PORTAUDIO
    if (paError == paNoError)
        return AudioStatus::success();

    int  hostApi  = -1;
    long hostCode = 0;
    std::string text = Pa_GetErrorText(paError);
    if (paError == paUnanticipatedHostError) {
        if (const PaHostErrorInfo* info = Pa_GetLastHostErrorInfo()) {
            hostApi  = static_cast<int>(info->hostApiType);
            hostCode = info->errorCode;
            if (info->errorText && info->errorText[0])
                text += std::string(" (") + info->errorText + ")";
        }
    }
    return AudioStatus::failure(classifyError(paError, hostApi, hostCode),
                                context + ": " + text);
#else
    (void)paError;
    return AudioStatus::failure(AudioError::NotInitialized,
                                context + ": built without HAS_PORTAUDIO");
#endif
}

AudioStatus PortAudioInput::defaultInputDevice(DeviceInfo& out) {
#ifdef HAS_PORTAUDIO
    if (!paInitialized_)
        return AudioStatus::failure(AudioError::NotInitialized,
                                    "PortAudio is not initialized");

    PaDeviceIndex index = Pa_GetDefaultInputDevice();
    if (index == paNoDevice)
        return AudioStatus::failure(AudioError::NoDevice,
                                    "no default audio input device");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels <= 0)
        return AudioStatus::failure(AudioError::NoDevice,
                                    "default input device has no inputs");

    out.id                = index;
    out.name              = info->name ? info->name : "";
    out.maxInputChannels  = info->maxInputChannels;
    out.defaultSampleRate = info->defaultSampleRate;
    spdlog::debug("Default input: '{}' ({} ch, {}Hz)",
                  out.name, out.maxInputChannels, out.defaultSampleRate);
    return AudioStatus::success();
#else
    (void)out;
    spdlog::warn("PortAudio not available — built without HAS_PORTAUDIO");
    return statusFromPa(-1, "default input");
#endif
}

AudioStatus PortAudioInput::defaultInputConfig(const DeviceInfo& device,
                                               StreamConfig& out) {
#ifdef HAS_PORTAUDIO
    if (!paInitialized_)
        return AudioStatus::failure(AudioError::NotInitialized,
                                    "PortAudio is not initialized");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device.id);
    if (!info)
        return AudioStatus::failure(AudioError::NoDevice,
                                    "invalid audio device ID " +
                                    std::to_string(device.id));

    StreamConfig config;
    config.channelCount   = std::min(std::max(info->maxInputChannels, 1), 2);
    config.sampleRate     = info->defaultSampleRate;
    config.framesPerBlock = paFramesPerBufferUnspecified;

    PaStreamParameters params;
    params.device                    = device.id;
    params.channelCount              = config.channelCount;
    params.sampleFormat              = paFloat32;
    params.suggestedLatency          = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_IsFormatSupported(&params, nullptr, config.sampleRate);
    if (err != paFormatIsSupported)
        return statusFromPa(err, "Pa_IsFormatSupported");

    out = config;
    return AudioStatus::success();
#else
    (void)device;
    (void)out;
    return statusFromPa(-1, "default input config");
#endif
}

AudioStatus PortAudioInput::openStream(const DeviceInfo& device,
                                       const StreamConfig& config,
                                       DataCallback onData,
                                       ErrorCallback onError,
                                       std::unique_ptr<Stream>& out) {
    out.reset();
#ifdef HAS_PORTAUDIO
    if (!paInitialized_)
        return AudioStatus::failure(AudioError::NotInitialized,
                                    "PortAudio is not initialized");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device.id);
    if (!info)
        return AudioStatus::failure(AudioError::NoDevice,
                                    "invalid audio device ID " +
                                    std::to_string(device.id));

    PaStreamParameters params;
    params.device                    = device.id;
    params.channelCount              = config.channelCount;
    params.sampleFormat              = paFloat32;
    params.suggestedLatency          = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    spdlog::debug("Opening input: device='{}', {} ch, {}Hz",
                  info->name, config.channelCount, config.sampleRate);

    auto stream = std::make_unique<PortAudioStream>(
        config.channelCount, std::move(onData), std::move(onError));

    PaError err = Pa_OpenStream(
        stream->handle(),
        &params,
        nullptr,  // no output
        config.sampleRate,
        static_cast<unsigned long>(config.framesPerBlock),
        paClipOff,
        &PortAudioStream::paCallback,
        stream.get());

    if (err != paNoError)
        return statusFromPa(err, "Pa_OpenStream");

    err = Pa_SetStreamFinishedCallback(*stream->handle(),
                                       &PortAudioStream::paFinished);
    if (err != paNoError)
        spdlog::warn("Pa_SetStreamFinishedCallback failed: {}",
                     Pa_GetErrorText(err));

    out = std::move(stream);
    return AudioStatus::success();
#else
    (void)device;
    (void)config;
    (void)onData;
    (void)onError;
    return statusFromPa(-1, "open input stream");
#endif
}
