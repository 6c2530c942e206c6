#pragma once
#include <string>
#include <utility>

// Microphone authorization as the OS reports it. Never cached: the user can
// flip it in System Settings while we run.
enum class PermissionStatus {
    Granted,
    Denied,
    Unknown     // never decided, or no way to tell
};

inline const char* permissionStatusToString(PermissionStatus s) {
    switch (s) {
        case PermissionStatus::Granted: return "granted";
        case PermissionStatus::Denied:  return "denied";
        case PermissionStatus::Unknown: return "unknown";
    }
    return "unknown";
}

enum class ProbeFailure {
    None,
    Denied,         // OS refused access
    DeviceAbsent,   // no input device to test against
    DeviceBusy,     // device held by another session, transient
    Other           // unexpected stream error
};

inline const char* probeFailureToString(ProbeFailure f) {
    switch (f) {
        case ProbeFailure::None:         return "none";
        case ProbeFailure::Denied:       return "denied";
        case ProbeFailure::DeviceAbsent: return "device_absent";
        case ProbeFailure::DeviceBusy:   return "device_busy";
        case ProbeFailure::Other:        return "other";
    }
    return "other";
}

// Outcome of one open/start/dwell/stop cycle on the default input.
struct CaptureProbeResult {
    bool         ok      = false;
    ProbeFailure failure = ProbeFailure::None;
    std::string  detail;        // platform error text, empty on success
    std::string  deviceName;    // device that was probed, if resolved

    // What this probe tells us about the permission state.
    PermissionStatus evidence() const {
        if (ok) return PermissionStatus::Granted;
        if (failure == ProbeFailure::Denied) return PermissionStatus::Denied;
        return PermissionStatus::Unknown;
    }

    static CaptureProbeResult success(std::string device) {
        CaptureProbeResult r;
        r.ok = true;
        r.deviceName = std::move(device);
        return r;
    }

    static CaptureProbeResult fail(ProbeFailure failure, std::string detail,
                                   std::string device = "") {
        CaptureProbeResult r;
        r.failure    = failure;
        r.detail     = std::move(detail);
        r.deviceName = std::move(device);
        return r;
    }
};

enum class GateFailure {
    None,
    PermissionDenied,
    DeviceAbsent,
    DeviceBusy,
    ProbeFailed
};

inline const char* gateFailureToString(GateFailure f) {
    switch (f) {
        case GateFailure::None:             return "none";
        case GateFailure::PermissionDenied: return "permission_denied";
        case GateFailure::DeviceAbsent:     return "device_absent";
        case GateFailure::DeviceBusy:       return "device_busy";
        case GateFailure::ProbeFailed:      return "probe_failed";
    }
    return "probe_failed";
}

// Decision handed to the recording-start path. When `allowed` is false the
// caller must not open a capture stream and should show `message`.
struct GateOutcome {
    bool        allowed = false;
    GateFailure reason  = GateFailure::None;
    std::string message;

    explicit operator bool() const { return allowed; }

    static GateOutcome granted() {
        GateOutcome o;
        o.allowed = true;
        return o;
    }

    static GateOutcome refused(GateFailure reason, std::string message) {
        GateOutcome o;
        o.reason  = reason;
        o.message = std::move(message);
        return o;
    }
};
