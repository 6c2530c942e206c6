#include "config/GateConfig.hpp"
#include "permission/OracleFactory.hpp"
#include "permission/PermissionGate.hpp"
#include "permission/SettingsLauncher.hpp"
#include "recording/RecordingStarter.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

static std::atomic<bool> g_stop{false};

static void signalHandler(int) {
    g_stop = true;
}

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

static void applyLogLevel(const std::string& level) {
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
}

static void printUsage() {
    std::cerr << "usage: micgate [status|probe|ensure|record|open-settings] "
                 "[config.json]\n";
}

static bool isCommand(const std::string& s) {
    return s == "status" || s == "probe" || s == "ensure" ||
           s == "record" || s == "open-settings";
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    // Setup logging
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "micgate.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "micgate",
        spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);
    applyLogLevel(getEnv("MICGATE_LOG_LEVEL", "info"));

    // Arguments: [command] [config]
    std::string command    = "ensure";
    std::string configPath = "config/micgate.json";
    int argi = 1;
    if (argi < argc && isCommand(argv[argi])) command = argv[argi++];
    if (argi < argc) configPath = argv[argi++];
    if (argi < argc) {
        printUsage();
        return 2;
    }

    GateConfig config;
    if (!GateConfig::loadFromFile(configPath, config)) {
        spdlog::error("Cannot load config file: {}", configPath);
        return 2;
    }
    if (!config.logLevel.empty()) applyLogLevel(config.logLevel);

    spdlog::info("MicGate v0.1.0 — {} ({})", command, configPath);

    if (command == "open-settings") {
        SettingsLauncher launcher;
        return launcher.openMicrophoneSettings() ? 0 : 1;
    }

    auto input  = createAudioInput(config);
    auto oracle = createPermissionOracle(*input, config);

    if (command == "status") {
        PermissionStatus status = oracle->checkStatus();
        std::cout << permissionStatusToString(status) << "\n";
        return status == PermissionStatus::Granted ? 0 : 1;
    }

    if (command == "probe") {
        CaptureProbeResult result = oracle->probe();
        std::cout << (result.ok ? "ok" : probeFailureToString(result.failure));
        if (!result.detail.empty()) std::cout << ": " << result.detail;
        std::cout << "\n";
        return result.ok ? 0 : 1;
    }

    PermissionGate gate(*oracle, config.gateSettings());
    if (config.warmUpOnStartup) gate.warmUp();

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (command == "ensure") {
        GateOutcome outcome = gate.ensureGranted();
        if (!outcome) {
            std::cerr << outcome.message << "\n";
            if (outcome.reason == GateFailure::PermissionDenied &&
                config.openSettingsOnDenial) {
                SettingsLauncher launcher;
                if (!launcher.openMicrophoneSettings())
                    spdlog::warn("Could not open microphone settings");
            }
            return 1;
        }
        std::cout << "granted\n";
        return 0;
    }

    // record: the recording-start path, then capture until done
    std::atomic<long long> frames{0};
    RecordingStarter starter(gate, *input);
    auto started = starter.start([&frames](const float*, int, int frameCount) {
        frames.fetch_add(frameCount, std::memory_order_relaxed);
    });
    if (!started.started) {
        std::cerr << started.error << "\n";
        if (started.gateFailure == GateFailure::PermissionDenied &&
            config.openSettingsOnDenial) {
            SettingsLauncher launcher;
            if (!launcher.openMicrophoneSettings())
                spdlog::warn("Could not open microphone settings");
        }
        return 1;
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(config.recordSeconds);
    while (!g_stop && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    AudioStatus stopped = started.stream->stop();
    if (!stopped.ok())
        spdlog::warn("Stopping recording: {}", stopped.message);
    started.stream.reset();

    spdlog::info("Captured {} frames from '{}'", frames.load(), started.deviceName);
    std::cout << frames.load() << " frames\n";
    return 0;
}
