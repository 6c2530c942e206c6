#pragma once
#include "PermissionTypes.hpp"
#include <string>

// Answers "may we capture the microphone right now?".
// Implementations: GatedConsentOracle (platforms with a consent dialog),
// PassThroughOracle (everything else).
class IPermissionOracle {
public:
    virtual ~IPermissionOracle() = default;

    // Pure read of the OS authorization. No stream is opened.
    virtual PermissionStatus checkStatus() = 0;

    // Real open/start/stop cycle on the default input. This is the only
    // call that can make the OS show its consent dialog. Blocking.
    virtual CaptureProbeResult probe() = 0;

    // Name for logging
    virtual std::string name() const = 0;
};
