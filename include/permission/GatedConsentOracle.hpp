#pragma once
#include "IPermissionOracle.hpp"
#include "IAuthorizationSource.hpp"
#include "audio/IAudioInput.hpp"
#include <memory>
#include <mutex>

// Oracle for platforms where the OS asks the user before an app may
// capture the microphone (macOS).
//
// checkStatus() is a plain authorization read. probe() makes a real access
// attempt: the OS only shows its one-time consent dialog when the process
// actually opens an input, so a status query alone stays Unknown forever.
//
//   resolve default input -> default config -> open (no-op callback)
//       -> start -> dwell -> stop -> release
//
// The stream is released on every path. Probes are serialized process-wide
// so a warm-up probe and a gate probe never hold the device together.
class GatedConsentOracle : public IPermissionOracle {
public:
    struct Settings {
        int probeDwellMs = 100;   // long enough for TCC to register the attempt
    };

    GatedConsentOracle(IAudioInput& input,
                       std::unique_ptr<IAuthorizationSource> authorization,
                       const Settings& settings);

    PermissionStatus checkStatus() override;
    CaptureProbeResult probe() override;
    std::string name() const override;

    const Settings& settings() const { return settings_; }

private:
    CaptureProbeResult classify(const AudioStatus& status,
                                const std::string& stage,
                                const std::string& deviceName);

    static std::mutex& probeMutex();

    IAudioInput&                          input_;
    std::unique_ptr<IAuthorizationSource> authorization_;
    Settings                              settings_;
};
