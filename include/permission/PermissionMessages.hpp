#pragma once
#include <string>

// User-facing text for refused recording attempts. Each message names what
// the user can actually do about it.
namespace PermissionMessages {

inline const char* denied() {
    return "Microphone access is denied. Enable it in System Settings → "
           "Privacy & Security → Microphone, then restart the app.";
}

inline const char* deviceAbsent() {
    return "No microphone was found. Connect an input device and try again.";
}

inline const char* deviceBusy() {
    return "The microphone is in use by another recording. "
           "Wait for it to finish and try again.";
}

inline std::string probeFailed(const std::string& detail) {
    std::string msg = "Could not verify microphone access";
    if (!detail.empty())
        msg += " (" + detail + ")";
    msg += ". If recording keeps failing, check System Settings → "
           "Privacy & Security → Microphone and restart the app.";
    return msg;
}

} // namespace PermissionMessages
