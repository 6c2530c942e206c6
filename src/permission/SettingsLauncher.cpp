#include "permission/SettingsLauncher.hpp"
#include <spdlog/spdlog.h>

#ifdef __APPLE__
#include <spawn.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

extern char** environ;
#endif

bool SettingsLauncher::openMicrophoneSettings() {
#ifdef __APPLE__
    spdlog::info("Opening System Settings → Privacy & Security → Microphone");

    const char* argv[] = {"open", kMicrophonePaneUrl, nullptr};
    pid_t pid = 0;
    int rc = posix_spawnp(&pid, "open", nullptr, nullptr,
                          const_cast<char* const*>(argv), environ);
    if (rc != 0) {
        spdlog::error("Failed to open System Settings: {}", std::strerror(rc));
        return false;
    }

    // `open` hands off to LaunchServices and exits immediately
    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        spdlog::warn("waitpid on `open` failed: {}", std::strerror(errno));
        return true;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::error("`open` exited with status {}", status);
        return false;
    }
    spdlog::info("Enable microphone access for this app, then restart it");
    return true;
#else
    spdlog::info("No microphone privacy settings pane on this platform");
    return false;
#endif
}
