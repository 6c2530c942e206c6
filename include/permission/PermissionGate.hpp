#pragma once
#include "IPermissionOracle.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

// Decides whether a recording may start, and resolves consent early.
//
// ensureGranted() is the single synchronous check every recording-start
// path calls. It re-reads the OS status every time (permission can be
// revoked between recordings) and only probes when not already granted.
//
// warmUp() is fired once at startup. It waits for the app to settle, then
// probes if needed so the consent dialog shows up at launch instead of in
// the middle of the user's first recording.
class PermissionGate {
public:
    struct Settings {
        int warmUpDelayMs    = 500;
        int busyRetries      = 2;     // extra probes when the device is busy
        int busyRetryDelayMs = 150;
    };

    PermissionGate(IPermissionOracle& oracle, const Settings& settings);
    ~PermissionGate();

    PermissionGate(const PermissionGate&) = delete;
    PermissionGate& operator=(const PermissionGate&) = delete;

    // Blocking. Bounded by the probe dwell time (plus busy retries).
    GateOutcome ensureGranted();

    // Non-blocking, fire-and-forget. Only the first call schedules work.
    void warmUp();

    // Wait until the warm-up task has finished. Returns false on timeout
    // or if warmUp() was never called.
    bool waitForWarmUp(int timeoutMs);

    bool warmUpScheduled() const { return warmUpScheduled_; }

    IPermissionOracle& oracle() { return oracle_; }

private:
    void warmUpLoop();
    CaptureProbeResult probeWithRetry();
    GateOutcome refusal(const CaptureProbeResult& probe,
                        PermissionStatus status) const;

    IPermissionOracle& oracle_;
    Settings           settings_;

    std::once_flag          warmUpOnce_;
    std::thread             warmUpThread_;
    std::atomic<bool>       warmUpScheduled_{false};
    bool                    warmUpDone_   = false;
    bool                    shuttingDown_ = false;
    std::mutex              mtx_;
    std::condition_variable cv_;
};
