#include <gtest/gtest.h>
#include "recording/RecordingStarter.hpp"
#include "permission/PermissionMessages.hpp"
#include "FakeAudioInput.hpp"
#include "FakePermission.hpp"

class RecordingStarterTest : public ::testing::Test {
protected:
    FakeAudioInput input;
    ScriptedOracle oracle;
    PermissionGate::Settings settings;

    void SetUp() override {
        settings.warmUpDelayMs    = 5;
        settings.busyRetries      = 0;
        settings.busyRetryDelayMs = 1;
    }
};

TEST_F(RecordingStarterTest, StartsWhenGranted) {
    oracle.status = PermissionStatus::Granted;
    PermissionGate gate(oracle, settings);
    RecordingStarter starter(gate, input);

    auto result = starter.start([](const float*, int, int) {});

    EXPECT_TRUE(result.started);
    ASSERT_NE(result.stream, nullptr);
    EXPECT_TRUE(result.stream->isActive());
    EXPECT_EQ(result.deviceName, "Fake Mic");
    EXPECT_EQ(input.opens.load(), 1);
    EXPECT_EQ(input.starts.load(), 1);
}

TEST_F(RecordingStarterTest, DeniedOpensNothing) {
    oracle.status = PermissionStatus::Denied;
    oracle.queueResult(CaptureProbeResult::fail(ProbeFailure::Denied, "refused"));
    PermissionGate gate(oracle, settings);
    RecordingStarter starter(gate, input);

    auto result = starter.start([](const float*, int, int) {});

    EXPECT_FALSE(result.started);
    EXPECT_EQ(result.gateFailure, GateFailure::PermissionDenied);
    EXPECT_EQ(result.error, PermissionMessages::denied());
    EXPECT_EQ(result.stream, nullptr);
    EXPECT_EQ(input.deviceLookups.load(), 0);
    EXPECT_EQ(input.opens.load(), 0);
}

TEST_F(RecordingStarterTest, AbsentDeviceRefusedByGate) {
    oracle.status = PermissionStatus::Unknown;
    oracle.queueResult(CaptureProbeResult::fail(ProbeFailure::DeviceAbsent, "none"));
    PermissionGate gate(oracle, settings);
    RecordingStarter starter(gate, input);

    auto result = starter.start(nullptr);

    EXPECT_FALSE(result.started);
    EXPECT_EQ(result.gateFailure, GateFailure::DeviceAbsent);
    EXPECT_EQ(input.opens.load(), 0);
}

TEST_F(RecordingStarterTest, StreamFailureAfterGateIsReported) {
    oracle.status = PermissionStatus::Granted;
    input.startError = AudioError::HostError;
    PermissionGate gate(oracle, settings);
    RecordingStarter starter(gate, input);

    auto result = starter.start(nullptr);

    EXPECT_FALSE(result.started);
    EXPECT_EQ(result.gateFailure, GateFailure::None);
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(result.stream, nullptr);
    EXPECT_EQ(input.openStreams.load(), 0);
}

TEST_F(RecordingStarterTest, GateRunsOnEveryStart) {
    oracle.status = PermissionStatus::Granted;
    PermissionGate gate(oracle, settings);
    RecordingStarter starter(gate, input);

    {
        auto first = starter.start(nullptr);
        EXPECT_TRUE(first.started);
    }
    oracle.status = PermissionStatus::Denied;
    oracle.queueResult(CaptureProbeResult::fail(ProbeFailure::Denied, "revoked"));

    auto second = starter.start(nullptr);
    EXPECT_FALSE(second.started);
    EXPECT_EQ(input.opens.load(), 1);
}
