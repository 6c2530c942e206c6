#include <gtest/gtest.h>
#include "permission/PermissionTypes.hpp"
#include "permission/PermissionMessages.hpp"

TEST(PermissionTypesTest, ProbeEvidence) {
    EXPECT_EQ(CaptureProbeResult::success("Mic").evidence(), PermissionStatus::Granted);
    EXPECT_EQ(CaptureProbeResult::fail(ProbeFailure::Denied, "").evidence(),
              PermissionStatus::Denied);
    EXPECT_EQ(CaptureProbeResult::fail(ProbeFailure::DeviceAbsent, "").evidence(),
              PermissionStatus::Unknown);
    EXPECT_EQ(CaptureProbeResult::fail(ProbeFailure::DeviceBusy, "").evidence(),
              PermissionStatus::Unknown);
    EXPECT_EQ(CaptureProbeResult::fail(ProbeFailure::Other, "").evidence(),
              PermissionStatus::Unknown);
}

TEST(PermissionTypesTest, GateOutcomeBool) {
    EXPECT_TRUE(static_cast<bool>(GateOutcome::granted()));
    auto refused = GateOutcome::refused(GateFailure::DeviceBusy, "busy");
    EXPECT_FALSE(static_cast<bool>(refused));
    EXPECT_EQ(refused.message, "busy");
}

TEST(PermissionTypesTest, Names) {
    EXPECT_STREQ(permissionStatusToString(PermissionStatus::Unknown), "unknown");
    EXPECT_STREQ(probeFailureToString(ProbeFailure::DeviceAbsent), "device_absent");
    EXPECT_STREQ(gateFailureToString(GateFailure::PermissionDenied), "permission_denied");
}

TEST(PermissionMessagesTest, DenialNamesRemedy) {
    std::string msg = PermissionMessages::denied();
    EXPECT_NE(msg.find("System Settings"), std::string::npos);
    EXPECT_NE(msg.find("Privacy & Security"), std::string::npos);
    EXPECT_NE(msg.find("Microphone"), std::string::npos);
    EXPECT_NE(msg.find("restart"), std::string::npos);
}

TEST(PermissionMessagesTest, AbsentAndBusyDoNotBlamePermission) {
    std::string absent = PermissionMessages::deviceAbsent();
    std::string busy   = PermissionMessages::deviceBusy();
    EXPECT_EQ(absent.find("denied"), std::string::npos);
    EXPECT_EQ(busy.find("denied"), std::string::npos);
    EXPECT_EQ(absent.find("Privacy"), std::string::npos);
    EXPECT_EQ(busy.find("Privacy"), std::string::npos);
}

TEST(PermissionMessagesTest, ProbeFailedCarriesDetail) {
    EXPECT_NE(PermissionMessages::probeFailed("host error -50").find("host error -50"),
              std::string::npos);
    EXPECT_EQ(PermissionMessages::probeFailed("").find("()"), std::string::npos);
}
