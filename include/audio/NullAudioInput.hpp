#pragma once
#include "IAudioInput.hpp"

// Audio host with no input devices. Selected with audio_backend = "null"
// (headless machines, CI) so the gate reports a missing microphone instead
// of touching hardware.
class NullAudioInput : public IAudioInput {
public:
    AudioStatus defaultInputDevice(DeviceInfo&) override {
        return AudioStatus::failure(AudioError::NoDevice,
                                    "null backend has no input devices");
    }

    AudioStatus defaultInputConfig(const DeviceInfo&, StreamConfig&) override {
        return AudioStatus::failure(AudioError::NoDevice,
                                    "null backend has no input devices");
    }

    AudioStatus openStream(const DeviceInfo&, const StreamConfig&,
                           DataCallback, ErrorCallback,
                           std::unique_ptr<Stream>& out) override {
        out.reset();
        return AudioStatus::failure(AudioError::NoDevice,
                                    "null backend has no input devices");
    }

    std::string backendName() const override { return "null"; }
};
