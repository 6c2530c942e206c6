#pragma once
#include "IPermissionOracle.hpp"

// Oracle for platforms without an OS-level microphone consent gate
// (Linux, Windows). Always granted; probing never touches a device.
class PassThroughOracle : public IPermissionOracle {
public:
    PermissionStatus checkStatus() override { return PermissionStatus::Granted; }
    CaptureProbeResult probe() override { return CaptureProbeResult::success(""); }
    std::string name() const override { return "pass-through"; }
};
