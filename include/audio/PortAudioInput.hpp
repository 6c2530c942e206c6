#pragma once
#include "IAudioInput.hpp"
#include <string>

// PortAudio-based input host. Supports Core Audio (macOS), ALSA/PulseAudio
// (Linux) and WASAPI/ASIO (Windows). Link with -lportaudio.
//
// Pa_Initialize/Pa_Terminate are tied to the lifetime of this object, so
// every stream it opens must be destroyed before it is.
//
// Built without HAS_PORTAUDIO every call reports NotInitialized.
class PortAudioInput : public IAudioInput {
public:
    PortAudioInput();
    ~PortAudioInput() override;

    PortAudioInput(const PortAudioInput&) = delete;
    PortAudioInput& operator=(const PortAudioInput&) = delete;

    AudioStatus defaultInputDevice(DeviceInfo& out) override;
    AudioStatus defaultInputConfig(const DeviceInfo& device,
                                   StreamConfig& out) override;
    AudioStatus openStream(const DeviceInfo& device,
                           const StreamConfig& config,
                           DataCallback onData,
                           ErrorCallback onError,
                           std::unique_ptr<Stream>& out) override;

    std::string backendName() const override { return "PortAudio"; }

    bool isInitialized() const { return paInitialized_; }

    // Map a PaError (plus the host error info for paUnanticipatedHostError)
    // onto AudioError. Exposed for tests.
    static AudioError classifyError(int paError, int hostApiType,
                                    long hostErrorCode);

private:
    AudioStatus statusFromPa(int paError, const std::string& context) const;

    bool paInitialized_ = false;
};
