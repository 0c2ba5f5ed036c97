#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace openfing::infra {

/**
 * @brief Scanner selection settings.
 */
struct ScannerConfig {
    std::string interfaceName;  ///< Interface override; empty to auto-detect.
    bool deepScan{false};       ///< Run deep-scan enrichment by default.
    std::vector<std::string> fullScanPaths{
        "/usr/sbin/arp-scan", "/usr/local/bin/arp-scan",
        "arp-scan"};            ///< Full-scan tool candidates, tried in order.
};

/**
 * @brief Fixed per-probe limits used by the system collaborators.
 */
struct TimingConfig {
    int pingTimeoutMs{1000};              ///< Per-host liveness probe timeout.
    int sweepSettleMs{2000};              ///< How long the sweep runs before the cache is read.
    int sweepConcurrency{64};             ///< Liveness probes in flight at once.
    int tcpConnectTimeoutMs{300};         ///< Deep-scan connect timeout.
    int reachabilityTimeoutMs{200};       ///< Reachability-stage connect timeout.
    int reachabilityConcurrency{128};     ///< Reachability connects in flight at once.
    int commandTimeoutSeconds{10};        ///< Wall-clock limit for external tools.
    int serviceLocationWindowMs{3000};    ///< SSDP listen window.
    int hostnameTimeoutSeconds{1};        ///< Reverse-lookup timeout.
};

/**
 * @brief Console and file logging settings.
 */
struct LoggingConfig {
    std::string level{"warn"};  ///< Console level name understood by spdlog.
    bool fileLogging{true};     ///< Also write a rotating log file.
};

/**
 * @brief Everything read from config.json.
 */
struct AppConfig {
    ScannerConfig scanner;
    TimingConfig timing;
    LoggingConfig logging;
};

/**
 * @brief Reads and writes config.json in the OpenFing configuration directory.
 *
 * Handles loading and saving of AppConfig as JSON. Keys missing from the file
 * keep their defaults; a missing file is created with defaults on load().
 */
class ConfigManager {
public:
    /**
     * @brief Creates the directory if needed; nothing is read until load().
     * @param configDir Directory holding config.json and openfing.log.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Resolves the default configuration directory.
     *
     * Uses $XDG_CONFIG_HOME/openfing, then ~/.config/openfing, then
     * ./.openfing when neither variable is set.
     */
    static std::filesystem::path defaultConfigDir();

    /**
     * @brief Reads config.json, writing the defaults first if it does not exist.
     * @return False if the file could not be parsed; defaults stay in effect.
     */
    bool load();

    /**
     * @brief Writes the current settings as indented JSON.
     * @return False if the file could not be written.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Full path of config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the rotating log file.
     */
    std::filesystem::path logPath() const { return configDir_ / "openfing.log"; }

    std::string configDir() const { return configDir_.string(); }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace openfing::infra
