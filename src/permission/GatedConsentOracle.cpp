#include "permission/GatedConsentOracle.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>
#include <utility>

GatedConsentOracle::GatedConsentOracle(
    IAudioInput& input,
    std::unique_ptr<IAuthorizationSource> authorization,
    const Settings& settings)
    : input_(input)
    , authorization_(std::move(authorization))
    , settings_(settings)
{
}

std::string GatedConsentOracle::name() const {
    return "gated-consent/" + authorization_->name();
}

std::mutex& GatedConsentOracle::probeMutex() {
    static std::mutex mtx;
    return mtx;
}

PermissionStatus GatedConsentOracle::checkStatus() {
    return authorization_->query();
}

CaptureProbeResult GatedConsentOracle::probe() {
    std::lock_guard lock(probeMutex());

    spdlog::info("Probing microphone access via {}", input_.backendName());

    IAudioInput::DeviceInfo device;
    AudioStatus st = input_.defaultInputDevice(device);
    if (!st.ok())
        return classify(st, "resolve default input", "");

    IAudioInput::StreamConfig config;
    st = input_.defaultInputConfig(device, config);
    if (!st.ok())
        return classify(st, "resolve input config", device.name);

    std::unique_ptr<IAudioInput::Stream> stream;
    st = input_.openStream(
        device, config,
        [](const float*, int, int) {},   // probe only, samples are dropped
        [](const std::string& message) {
            spdlog::warn("Probe stream error: {}", message);
        },
        stream);
    if (!st.ok() || !stream) {
        if (st.ok())
            st = AudioStatus::failure(AudioError::HostError,
                                      "backend returned no stream");
        return classify(st, "open input stream", device.name);
    }

    AudioStatus started = stream->start();
    if (started.ok())
        std::this_thread::sleep_for(
            std::chrono::milliseconds(settings_.probeDwellMs));

    AudioStatus stopped = stream->stop();
    if (!stopped.ok())
        spdlog::warn("Probe stream stop failed: {}", stopped.message);
    stream.reset();   // closes the stream and frees the device

    if (!started.ok())
        return classify(started, "start input stream", device.name);

    // macOS lets a denied process open and run an input; it just delivers
    // silence. Only the authorization store can tell us.
    if (authorization_->query() == PermissionStatus::Denied) {
        spdlog::warn("Probe stream ran on '{}' but access is denied",
                     device.name);
        return CaptureProbeResult::fail(ProbeFailure::Denied,
                                        "stream opened but authorization is denied",
                                        device.name);
    }

    spdlog::info("Microphone probe succeeded on '{}'", device.name);
    return CaptureProbeResult::success(device.name);
}

CaptureProbeResult GatedConsentOracle::classify(const AudioStatus& status,
                                                const std::string& stage,
                                                const std::string& deviceName) {
    std::string detail = stage + ": " + status.message;

    switch (status.code) {
        case AudioError::NoDevice:
            spdlog::warn("Microphone probe: no input device ({})", detail);
            return CaptureProbeResult::fail(ProbeFailure::DeviceAbsent,
                                            detail, deviceName);
        case AudioError::DeviceBusy:
            spdlog::info("Microphone probe: device busy ({})", detail);
            return CaptureProbeResult::fail(ProbeFailure::DeviceBusy,
                                            detail, deviceName);
        case AudioError::PermissionDenied:
            spdlog::warn("Microphone probe: access denied ({})", detail);
            return CaptureProbeResult::fail(ProbeFailure::Denied,
                                            detail, deviceName);
        default:
            break;
    }

    // Host errors are opaque; the authorization store decides whether this
    // was a refusal.
    if (authorization_->query() == PermissionStatus::Denied) {
        spdlog::warn("Microphone probe failed with access denied ({})", detail);
        return CaptureProbeResult::fail(ProbeFailure::Denied, detail, deviceName);
    }

    spdlog::error("Microphone probe failed: {} [{}]",
                  detail, audioErrorToString(status.code));
    return CaptureProbeResult::fail(ProbeFailure::Other, detail, deviceName);
}
