#include "recording/RecordingStarter.hpp"
#include <spdlog/spdlog.h>
#include <utility>

RecordingStarter::StartResult RecordingStarter::start(
    IAudioInput::DataCallback onData) {
    StartResult result;

    GateOutcome gate = gate_.ensureGranted();
    if (!gate) {
        result.gateFailure = gate.reason;
        result.error       = gate.message;
        return result;
    }

    IAudioInput::DeviceInfo device;
    AudioStatus st = input_.defaultInputDevice(device);
    if (!st.ok()) {
        result.error = "Cannot start recording: " + st.message;
        spdlog::error("{}", result.error);
        return result;
    }
    result.deviceName = device.name;

    IAudioInput::StreamConfig config;
    st = input_.defaultInputConfig(device, config);
    if (!st.ok()) {
        result.error = "Cannot start recording: " + st.message;
        spdlog::error("{}", result.error);
        return result;
    }

    std::unique_ptr<IAudioInput::Stream> stream;
    st = input_.openStream(
        device, config, std::move(onData),
        [](const std::string& message) {
            spdlog::error("Recording stream error: {}", message);
        },
        stream);
    if (!st.ok() || !stream) {
        result.error = "Cannot start recording: " +
            (st.ok() ? std::string("backend returned no stream") : st.message);
        spdlog::error("{}", result.error);
        return result;
    }

    st = stream->start();
    if (!st.ok()) {
        result.error = "Cannot start recording: " + st.message;
        spdlog::error("{}", result.error);
        return result;   // stream closes on destruction
    }

    spdlog::info("Recording started on '{}' ({} ch, {}Hz)",
                 device.name, config.channelCount, config.sampleRate);
    result.started = true;
    result.stream  = std::move(stream);
    return result;
}
