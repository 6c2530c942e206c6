#pragma once
#include <cerrno>
#include <string>
#include <utility>

// Error classes reported by the audio input boundary. Backends map their
// native error codes onto these so callers can tell "no hardware" apart
// from "no permission" and from "someone else has the device".
enum class AudioError {
    None,
    NoDevice,          // no default input / device vanished
    DeviceBusy,        // device exists but is held by another session
    PermissionDenied,  // OS refused access to the device
    InvalidConfig,     // device rejected the stream format
    NotInitialized,    // backend failed to initialise
    HostError          // anything else the host API reported
};

inline const char* audioErrorToString(AudioError e) {
    switch (e) {
        case AudioError::None:             return "none";
        case AudioError::NoDevice:         return "no_device";
        case AudioError::DeviceBusy:       return "device_busy";
        case AudioError::PermissionDenied: return "permission_denied";
        case AudioError::InvalidConfig:    return "invalid_config";
        case AudioError::NotInitialized:   return "not_initialized";
        case AudioError::HostError:        return "host_error";
    }
    return "unknown";
}

struct AudioStatus {
    AudioError  code = AudioError::None;
    std::string message;

    bool ok() const { return code == AudioError::None; }

    static AudioStatus success() { return {}; }
    static AudioStatus failure(AudioError code, std::string message) {
        return {code, std::move(message)};
    }
};

// Classify a negative-errno host error code (ALSA and OSS report these
// through PortAudio's host error info).
inline AudioError classifyHostErrno(long hostErrorCode) {
    long err = hostErrorCode < 0 ? -hostErrorCode : hostErrorCode;
    switch (err) {
        case EBUSY:
        case EAGAIN:
            return AudioError::DeviceBusy;
        case EACCES:
        case EPERM:
            return AudioError::PermissionDenied;
        case ENODEV:
        case ENOENT:
        case ENXIO:
            return AudioError::NoDevice;
        case EINVAL:
            return AudioError::InvalidConfig;
        default:
            return AudioError::HostError;
    }
}
