#pragma once
#include "permission/GatedConsentOracle.hpp"
#include "permission/PermissionGate.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <string>

// Runtime settings for the permission subsystem, read from
// config/micgate.json (or the path given on the command line).
struct GateConfig {
    int  warmUpDelayMs        = 500;   // startup settle time before the probe
    int  probeDwellMs         = 100;   // how long the probe stream stays open
    int  busyRetries          = 2;
    int  busyRetryDelayMs     = 150;
    bool warmUpOnStartup      = true;
    bool openSettingsOnDenial = false;
    int  recordSeconds        = 5;     // `micgate record` duration

    std::string oracleMode   = "auto";       // "auto" | "pass_through"
    std::string audioBackend = "portaudio";  // "portaudio" | "null"
    std::string logLevel;                    // empty = keep env/default

    PermissionGate::Settings gateSettings() const {
        PermissionGate::Settings s;
        s.warmUpDelayMs    = warmUpDelayMs;
        s.busyRetries      = busyRetries;
        s.busyRetryDelayMs = busyRetryDelayMs;
        return s;
    }

    GatedConsentOracle::Settings oracleSettings() const {
        GatedConsentOracle::Settings s;
        s.probeDwellMs = probeDwellMs;
        return s;
    }

    static GateConfig fromJson(const nlohmann::json& j) {
        GateConfig c;
        c.warmUpDelayMs        = std::max(0, j.value("warm_up_delay_ms", c.warmUpDelayMs));
        c.probeDwellMs         = std::max(0, j.value("probe_dwell_ms", c.probeDwellMs));
        c.busyRetries          = std::max(0, j.value("busy_retries", c.busyRetries));
        c.busyRetryDelayMs     = std::max(0, j.value("busy_retry_delay_ms", c.busyRetryDelayMs));
        c.warmUpOnStartup      = j.value("warm_up_on_startup", c.warmUpOnStartup);
        c.openSettingsOnDenial = j.value("open_settings_on_denial", c.openSettingsOnDenial);
        c.recordSeconds        = std::max(0, j.value("record_seconds", c.recordSeconds));
        c.oracleMode           = j.value("oracle_mode", c.oracleMode);
        c.audioBackend         = j.value("audio_backend", c.audioBackend);
        c.logLevel             = j.value("log_level", c.logLevel);
        return c;
    }

    // Returns false if the file is missing or not valid JSON.
    static bool loadFromFile(const std::string& path, GateConfig& out) {
        std::ifstream f(path);
        if (!f.is_open()) return false;
        try {
            nlohmann::json j;
            f >> j;
            if (!j.is_object()) {
                spdlog::error("Config {} is not a JSON object", path);
                return false;
            }
            out = fromJson(j);
            return true;
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("Config {} is invalid: {}", path, e.what());
            return false;
        }
    }
};
