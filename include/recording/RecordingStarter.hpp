#pragma once
#include "audio/IAudioInput.hpp"
#include "permission/PermissionGate.hpp"
#include <memory>
#include <string>

// Recording-start path. Every capture stream the app opens goes through
// start(): the permission gate runs first, and a refused gate is a hard
// stop: no stream is opened that we already know would be silent.
class RecordingStarter {
public:
    struct StartResult {
        bool        started = false;
        GateFailure gateFailure = GateFailure::None;   // set when the gate refused
        std::string error;                             // user-facing text
        std::string deviceName;
        std::unique_ptr<IAudioInput::Stream> stream;   // running stream on success
    };

    RecordingStarter(PermissionGate& gate, IAudioInput& input)
        : gate_(gate), input_(input) {}

    StartResult start(IAudioInput::DataCallback onData);

private:
    PermissionGate& gate_;
    IAudioInput&    input_;
};
