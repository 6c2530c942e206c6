#pragma once
#include "audio/IAudioInput.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>

// Scriptable in-memory audio host. Counts every open/start/stop/close so
// tests can assert that probes release the device.
class FakeAudioInput : public IAudioInput {
public:
    // Behaviour knobs (set before the code under test runs)
    bool       hasDevice      = true;
    bool       exclusive      = true;   // a second concurrent open reports busy
    AudioError configError    = AudioError::None;
    AudioError openError      = AudioError::None;
    AudioError startError     = AudioError::None;
    int        busyOpens      = 0;      // next N opens fail with DeviceBusy
    bool       reportStreamError = false;  // fire the error callback on start
    std::function<void()> onStart;      // e.g. user answers the consent dialog

    // Observations
    std::atomic<int> deviceLookups{0};
    std::atomic<int> opens{0};
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> closes{0};
    std::atomic<int> openStreams{0};

    class FakeStream : public Stream {
    public:
        FakeStream(FakeAudioInput& owner, ErrorCallback onError)
            : owner_(owner), onError_(std::move(onError)) {}

        ~FakeStream() override {
            owner_.closes++;
            owner_.openStreams--;
        }

        AudioStatus start() override {
            owner_.starts++;
            if (owner_.startError != AudioError::None)
                return AudioStatus::failure(owner_.startError, "fake start failure");
            active_ = true;
            if (owner_.reportStreamError && onError_)
                onError_("fake stream glitch");
            if (owner_.onStart) owner_.onStart();
            return AudioStatus::success();
        }

        AudioStatus stop() override {
            owner_.stops++;
            active_ = false;
            return AudioStatus::success();
        }

        bool isActive() const override { return active_; }

    private:
        FakeAudioInput& owner_;
        ErrorCallback   onError_;
        bool            active_ = false;
    };

    AudioStatus defaultInputDevice(DeviceInfo& out) override {
        deviceLookups++;
        if (!hasDevice)
            return AudioStatus::failure(AudioError::NoDevice, "no default input");
        out.id                = 0;
        out.name              = "Fake Mic";
        out.maxInputChannels  = 1;
        out.defaultSampleRate = 48000;
        return AudioStatus::success();
    }

    AudioStatus defaultInputConfig(const DeviceInfo&, StreamConfig& out) override {
        if (configError != AudioError::None)
            return AudioStatus::failure(configError, "fake config failure");
        out.channelCount   = 1;
        out.sampleRate     = 48000;
        out.framesPerBlock = 0;
        return AudioStatus::success();
    }

    AudioStatus openStream(const DeviceInfo&, const StreamConfig&,
                           DataCallback, ErrorCallback onError,
                           std::unique_ptr<Stream>& out) override {
        out.reset();
        if (!hasDevice)
            return AudioStatus::failure(AudioError::NoDevice, "device vanished");
        if (busyOpens > 0) {
            busyOpens--;
            return AudioStatus::failure(AudioError::DeviceBusy, "device unavailable");
        }
        if (exclusive && openStreams > 0)
            return AudioStatus::failure(AudioError::DeviceBusy, "device unavailable");
        if (openError != AudioError::None)
            return AudioStatus::failure(openError, "fake open failure");

        opens++;
        openStreams++;
        out = std::make_unique<FakeStream>(*this, std::move(onError));
        return AudioStatus::success();
    }

    std::string backendName() const override { return "fake"; }
};
