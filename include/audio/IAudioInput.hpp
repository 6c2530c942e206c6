#pragma once
#include "AudioError.hpp"
#include <functional>
#include <memory>
#include <string>

// Abstract audio input host.
// Implementations: PortAudioInput (CoreAudio/ALSA/WASAPI), NullAudioInput (no devices).
//
// Every call reports an AudioStatus so the permission layer can classify
// failures (no device vs. busy vs. denied) without knowing the backend.
class IAudioInput {
public:
    virtual ~IAudioInput() = default;

    struct DeviceInfo {
        int         id                = -1;
        std::string name;
        int         maxInputChannels  = 0;
        double      defaultSampleRate = 0.0;
    };

    struct StreamConfig {
        int    channelCount   = 1;
        double sampleRate     = 48000;
        int    framesPerBlock = 0;    // 0 = let the host choose
    };

    // Called on the audio thread. Samples are interleaved:
    // [ch0_s0, ch1_s0, ..., ch0_s1, ch1_s1, ...]
    using DataCallback = std::function<void(const float* samples,
                                            int channelCount,
                                            int frameCount)>;

    // Called when the stream fails after it was opened. Never on the
    // real-time path.
    using ErrorCallback = std::function<void(const std::string& message)>;

    // An opened input stream. Destroying it closes the stream and
    // releases the device, whether or not it was stopped first.
    class Stream {
    public:
        virtual ~Stream() = default;
        virtual AudioStatus start() = 0;
        virtual AudioStatus stop() = 0;
        virtual bool isActive() const = 0;
    };

    // Device lookup
    virtual AudioStatus defaultInputDevice(DeviceInfo& out) = 0;
    virtual AudioStatus defaultInputConfig(const DeviceInfo& device,
                                           StreamConfig& out) = 0;

    // Stream construction. On success `out` holds the opened (not yet
    // started) stream.
    virtual AudioStatus openStream(const DeviceInfo& device,
                                   const StreamConfig& config,
                                   DataCallback onData,
                                   ErrorCallback onError,
                                   std::unique_ptr<Stream>& out) = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
