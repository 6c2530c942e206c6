#include <gtest/gtest.h>
#include "config/GateConfig.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class GateConfigTest : public ::testing::Test {
protected:
    fs::path tmpDir_;

    void SetUp() override {
        tmpDir_ = fs::temp_directory_path() / "micgate_config_test";
        fs::create_directories(tmpDir_);
    }

    void TearDown() override {
        fs::remove_all(tmpDir_);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        std::ofstream f(tmpDir_ / name);
        f << content;
        return (tmpDir_ / name).string();
    }
};

TEST_F(GateConfigTest, Defaults) {
    GateConfig c;
    EXPECT_EQ(c.warmUpDelayMs, 500);
    EXPECT_EQ(c.probeDwellMs, 100);
    EXPECT_EQ(c.busyRetries, 2);
    EXPECT_TRUE(c.warmUpOnStartup);
    EXPECT_FALSE(c.openSettingsOnDenial);
    EXPECT_EQ(c.oracleMode, "auto");
    EXPECT_EQ(c.audioBackend, "portaudio");
}

TEST_F(GateConfigTest, EmptyObjectKeepsDefaults) {
    GateConfig c = GateConfig::fromJson(nlohmann::json::object());
    GateConfig d;
    EXPECT_EQ(c.warmUpDelayMs, d.warmUpDelayMs);
    EXPECT_EQ(c.probeDwellMs, d.probeDwellMs);
    EXPECT_EQ(c.oracleMode, d.oracleMode);
}

TEST_F(GateConfigTest, ReadsAllKeys) {
    auto j = nlohmann::json::parse(R"({
        "warm_up_delay_ms": 250,
        "probe_dwell_ms": 80,
        "busy_retries": 4,
        "busy_retry_delay_ms": 20,
        "warm_up_on_startup": false,
        "open_settings_on_denial": true,
        "record_seconds": 12,
        "oracle_mode": "pass_through",
        "audio_backend": "null",
        "log_level": "debug"
    })");

    GateConfig c = GateConfig::fromJson(j);
    EXPECT_EQ(c.warmUpDelayMs, 250);
    EXPECT_EQ(c.probeDwellMs, 80);
    EXPECT_EQ(c.busyRetries, 4);
    EXPECT_EQ(c.busyRetryDelayMs, 20);
    EXPECT_FALSE(c.warmUpOnStartup);
    EXPECT_TRUE(c.openSettingsOnDenial);
    EXPECT_EQ(c.recordSeconds, 12);
    EXPECT_EQ(c.oracleMode, "pass_through");
    EXPECT_EQ(c.audioBackend, "null");
    EXPECT_EQ(c.logLevel, "debug");
}

TEST_F(GateConfigTest, NegativeValuesClampToZero) {
    auto j = nlohmann::json::parse(R"({"warm_up_delay_ms": -5, "busy_retries": -1, "probe_dwell_ms": -100})");
    GateConfig c = GateConfig::fromJson(j);
    EXPECT_EQ(c.warmUpDelayMs, 0);
    EXPECT_EQ(c.busyRetries, 0);
    EXPECT_EQ(c.probeDwellMs, 0);
}

TEST_F(GateConfigTest, SettingsPassThrough) {
    GateConfig c;
    c.warmUpDelayMs    = 42;
    c.busyRetries      = 7;
    c.busyRetryDelayMs = 9;
    c.probeDwellMs     = 33;

    auto gs = c.gateSettings();
    EXPECT_EQ(gs.warmUpDelayMs, 42);
    EXPECT_EQ(gs.busyRetries, 7);
    EXPECT_EQ(gs.busyRetryDelayMs, 9);
    EXPECT_EQ(c.oracleSettings().probeDwellMs, 33);
}

TEST_F(GateConfigTest, LoadFromFile) {
    auto path = writeFile("micgate.json", R"({"probe_dwell_ms": 120, "oracle_mode": "auto"})");
    GateConfig c;
    ASSERT_TRUE(GateConfig::loadFromFile(path, c));
    EXPECT_EQ(c.probeDwellMs, 120);
}

TEST_F(GateConfigTest, MissingFileFails) {
    GateConfig c;
    EXPECT_FALSE(GateConfig::loadFromFile((tmpDir_ / "nope.json").string(), c));
}

TEST_F(GateConfigTest, MalformedFileFails) {
    auto path = writeFile("bad.json", "{ \"probe_dwell_ms\": ");
    GateConfig c;
    c.probeDwellMs = 77;
    EXPECT_FALSE(GateConfig::loadFromFile(path, c));
    EXPECT_EQ(c.probeDwellMs, 77);   // untouched
}

TEST_F(GateConfigTest, WrongTypeFails) {
    auto path = writeFile("type.json", R"({"probe_dwell_ms": "long"})");
    GateConfig c;
    EXPECT_FALSE(GateConfig::loadFromFile(path, c));
}

TEST_F(GateConfigTest, NonObjectFails) {
    auto path = writeFile("array.json", "[1, 2, 3]");
    GateConfig c;
    EXPECT_FALSE(GateConfig::loadFromFile(path, c));
}
