#include "permission/OracleFactory.hpp"
#include "permission/GatedConsentOracle.hpp"
#include "permission/PassThroughOracle.hpp"
#include "audio/PortAudioInput.hpp"
#include "audio/NullAudioInput.hpp"
#include <spdlog/spdlog.h>

#ifdef __APPLE__
#include "permission/AVFoundationAuthorization.hpp"
#endif

bool platformHasConsentGate() {
#ifdef __APPLE__
    return true;
#else
    return false;
#endif
}

std::unique_ptr<IPermissionOracle> createPermissionOracle(IAudioInput& input,
                                                          const GateConfig& config) {
    if (config.oracleMode == "pass_through") {
        spdlog::info("Permission oracle: pass-through (forced by config)");
        return std::make_unique<PassThroughOracle>();
    }
    if (config.oracleMode != "auto") {
        spdlog::warn("Unknown oracle_mode '{}' — using auto", config.oracleMode);
    }

#ifdef __APPLE__
    auto oracle = std::make_unique<GatedConsentOracle>(
        input, std::make_unique<AVFoundationAuthorization>(),
        config.oracleSettings());
    spdlog::info("Permission oracle: {}", oracle->name());
    return oracle;
#else
    (void)input;
    spdlog::info("Permission oracle: pass-through (no consent gate on this platform)");
    return std::make_unique<PassThroughOracle>();
#endif
}

std::unique_ptr<IAudioInput> createAudioInput(const GateConfig& config) {
    if (config.audioBackend == "null") {
        spdlog::info("Audio backend: null");
        return std::make_unique<NullAudioInput>();
    }
    if (config.audioBackend != "portaudio") {
        spdlog::warn("Unknown audio_backend '{}' — using portaudio",
                     config.audioBackend);
    }
    auto input = std::make_unique<PortAudioInput>();
    spdlog::info("Audio backend: {}{}", input->backendName(),
                 input->isInitialized() ? "" : " (not initialized)");
    return input;
}
