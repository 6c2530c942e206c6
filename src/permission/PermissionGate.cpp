#include "permission/PermissionGate.hpp"
#include "permission/PermissionMessages.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

PermissionGate::PermissionGate(IPermissionOracle& oracle,
                               const Settings& settings)
    : oracle_(oracle)
    , settings_(settings)
{
}

PermissionGate::~PermissionGate() {
    {
        std::lock_guard lock(mtx_);
        shuttingDown_ = true;
    }
    cv_.notify_all();
    if (warmUpThread_.joinable())
        warmUpThread_.join();
}

// ── Synchronous gate ─────────────────────────────────────────────────────

GateOutcome PermissionGate::ensureGranted() {
    PermissionStatus status = oracle_.checkStatus();
    if (status == PermissionStatus::Granted)
        return GateOutcome::granted();

    spdlog::info("Microphone permission {} — probing before recording",
                 permissionStatusToString(status));

    CaptureProbeResult probe = probeWithRetry();

    // A stream that really ran is proof of access unless the OS now says
    // otherwise.
    status = oracle_.checkStatus();
    if (probe.ok && status != PermissionStatus::Denied)
        status = PermissionStatus::Granted;

    if (status == PermissionStatus::Granted) {
        spdlog::info("Microphone permission granted");
        return GateOutcome::granted();
    }

    GateOutcome outcome = refusal(probe, status);
    spdlog::warn("Recording blocked [{}]: {}",
                 gateFailureToString(outcome.reason), outcome.message);
    return outcome;
}

CaptureProbeResult PermissionGate::probeWithRetry() {
    CaptureProbeResult result = oracle_.probe();
    for (int attempt = 1;
         attempt <= settings_.busyRetries &&
         result.failure == ProbeFailure::DeviceBusy;
         attempt++) {
        spdlog::debug("Input device busy, retrying probe ({}/{})",
                      attempt, settings_.busyRetries);
        std::this_thread::sleep_for(
            std::chrono::milliseconds(settings_.busyRetryDelayMs));
        result = oracle_.probe();
    }
    return result;
}

GateOutcome PermissionGate::refusal(const CaptureProbeResult& probe,
                                    PermissionStatus status) const {
    if (status == PermissionStatus::Denied ||
        probe.failure == ProbeFailure::Denied)
        return GateOutcome::refused(GateFailure::PermissionDenied,
                                    PermissionMessages::denied());

    switch (probe.failure) {
        case ProbeFailure::DeviceAbsent:
            return GateOutcome::refused(GateFailure::DeviceAbsent,
                                        PermissionMessages::deviceAbsent());
        case ProbeFailure::DeviceBusy:
            return GateOutcome::refused(GateFailure::DeviceBusy,
                                        PermissionMessages::deviceBusy());
        default:
            return GateOutcome::refused(GateFailure::ProbeFailed,
                                        PermissionMessages::probeFailed(probe.detail));
    }
}

// ── Startup warm-up ──────────────────────────────────────────────────────

void PermissionGate::warmUp() {
    std::call_once(warmUpOnce_, [this] {
        spdlog::info("Scheduling microphone permission warm-up in {}ms ({})",
                     settings_.warmUpDelayMs, oracle_.name());
        warmUpScheduled_ = true;
        warmUpThread_ = std::thread(&PermissionGate::warmUpLoop, this);
    });
}

bool PermissionGate::waitForWarmUp(int timeoutMs) {
    if (!warmUpScheduled_) return false;
    std::unique_lock lock(mtx_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                        [this] { return warmUpDone_; });
}

void PermissionGate::warmUpLoop() {
    {
        // Let the rest of startup (window, audio engine) settle first
        std::unique_lock lock(mtx_);
        bool stopping = cv_.wait_for(
            lock, std::chrono::milliseconds(settings_.warmUpDelayMs),
            [this] { return shuttingDown_; });
        if (stopping) {
            spdlog::debug("Microphone warm-up cancelled by shutdown");
            warmUpDone_ = true;
            cv_.notify_all();
            return;
        }
    }

    PermissionStatus status = oracle_.checkStatus();
    if (status == PermissionStatus::Granted) {
        spdlog::info("Microphone permission already granted");
    } else {
        spdlog::info("Microphone permission {} — requesting at startup",
                     permissionStatusToString(status));
        CaptureProbeResult result = oracle_.probe();
        if (result.ok) {
            spdlog::info("Startup microphone probe succeeded");
        } else {
            spdlog::warn("Startup microphone probe: {} ({})",
                         probeFailureToString(result.failure), result.detail);
        }
    }

    {
        std::lock_guard lock(mtx_);
        warmUpDone_ = true;
    }
    cv_.notify_all();
}
