#pragma once
#include <string>

// Opens the OS privacy pane where the user can grant microphone access.
// Only macOS has such a pane; elsewhere this logs and returns false.
class SettingsLauncher {
public:
    static constexpr const char* kMicrophonePaneUrl =
        "x-apple.systempreferences:com.apple.preference.security?Privacy_Microphone";

    // Returns true if the settings app was launched.
    bool openMicrophoneSettings();
};
