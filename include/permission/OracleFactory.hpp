#pragma once
#include "IPermissionOracle.hpp"
#include "audio/IAudioInput.hpp"
#include "config/GateConfig.hpp"
#include <memory>

// Picks the oracle variant once at startup.
//   oracle_mode "auto"         -> GatedConsentOracle on Apple builds,
//                                 PassThroughOracle everywhere else
//   oracle_mode "pass_through" -> PassThroughOracle
std::unique_ptr<IPermissionOracle> createPermissionOracle(IAudioInput& input,
                                                          const GateConfig& config);

// audio_backend "portaudio" (default) or "null".
std::unique_ptr<IAudioInput> createAudioInput(const GateConfig& config);

// True when this build targets a platform with an OS microphone consent gate.
bool platformHasConsentGate();
