#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace openfing::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir)
    : configDir_(configDir), configPath_(configDir / "config.json") {
    std::error_code ec;
    if (!std::filesystem::exists(configDir_, ec)) {
        std::filesystem::create_directories(configDir_, ec);
        if (ec) {
            spdlog::warn("Cannot create config directory {}: {}", configDir_.string(),
                         ec.message());
        }
    }
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "openfing";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "openfing";
    }
    return std::filesystem::path(".openfing");
}

bool ConfigManager::load() {
    std::error_code ec;
    if (!std::filesystem::exists(configPath_, ec)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to load config, keeping defaults: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::warn("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Scanner
    j["scanner"]["interface"] = config_.scanner.interfaceName;
    j["scanner"]["deep_scan"] = config_.scanner.deepScan;
    j["scanner"]["full_scan_paths"] = config_.scanner.fullScanPaths;

    // Timing
    const auto& t = config_.timing;
    j["timing"]["ping_timeout_ms"] = t.pingTimeoutMs;
    j["timing"]["sweep_settle_ms"] = t.sweepSettleMs;
    j["timing"]["sweep_concurrency"] = t.sweepConcurrency;
    j["timing"]["tcp_connect_timeout_ms"] = t.tcpConnectTimeoutMs;
    j["timing"]["reachability_timeout_ms"] = t.reachabilityTimeoutMs;
    j["timing"]["reachability_concurrency"] = t.reachabilityConcurrency;
    j["timing"]["command_timeout_seconds"] = t.commandTimeoutSeconds;
    j["timing"]["service_location_window_ms"] = t.serviceLocationWindowMs;
    j["timing"]["hostname_timeout_seconds"] = t.hostnameTimeoutSeconds;

    // Logging
    j["logging"]["level"] = config_.logging.level;
    j["logging"]["file_logging"] = config_.logging.fileLogging;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    if (j.contains("scanner")) {
        const auto& s = j["scanner"];
        config_.scanner.interfaceName = s.value("interface", defaults.scanner.interfaceName);
        config_.scanner.deepScan = s.value("deep_scan", defaults.scanner.deepScan);
        config_.scanner.fullScanPaths =
            s.value("full_scan_paths", defaults.scanner.fullScanPaths);
    }

    if (j.contains("timing")) {
        const auto& t = j["timing"];
        const auto& d = defaults.timing;
        config_.timing.pingTimeoutMs = t.value("ping_timeout_ms", d.pingTimeoutMs);
        config_.timing.sweepSettleMs = t.value("sweep_settle_ms", d.sweepSettleMs);
        config_.timing.sweepConcurrency = t.value("sweep_concurrency", d.sweepConcurrency);
        config_.timing.tcpConnectTimeoutMs =
            t.value("tcp_connect_timeout_ms", d.tcpConnectTimeoutMs);
        config_.timing.reachabilityTimeoutMs =
            t.value("reachability_timeout_ms", d.reachabilityTimeoutMs);
        config_.timing.reachabilityConcurrency =
            t.value("reachability_concurrency", d.reachabilityConcurrency);
        config_.timing.commandTimeoutSeconds =
            t.value("command_timeout_seconds", d.commandTimeoutSeconds);
        config_.timing.serviceLocationWindowMs =
            t.value("service_location_window_ms", d.serviceLocationWindowMs);
        config_.timing.hostnameTimeoutSeconds =
            t.value("hostname_timeout_seconds", d.hostnameTimeoutSeconds);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logging.level = l.value("level", defaults.logging.level);
        config_.logging.fileLogging = l.value("file_logging", defaults.logging.fileLogging);
    }
}

} // namespace openfing::infra
