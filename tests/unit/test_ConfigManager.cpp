#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace openfing::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "openfing_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const std::string& content) const {
        std::ofstream file(configDir_ / "config.json");
        file << content;
    }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove_all(configDir_, ec);
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "openfing_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets config and log paths") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.logPath() == testDir.path() / "openfing.log");
    }
}

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    AppConfig config;

    SECTION("Scanner") {
        REQUIRE(config.scanner.interfaceName.empty());
        REQUIRE_FALSE(config.scanner.deepScan);
        REQUIRE(config.scanner.fullScanPaths.size() == 3);
        REQUIRE(config.scanner.fullScanPaths.front() == "/usr/sbin/arp-scan");
        REQUIRE(config.scanner.fullScanPaths.back() == "arp-scan");
    }

    SECTION("Timing") {
        REQUIRE(config.timing.pingTimeoutMs == 1000);
        REQUIRE(config.timing.sweepSettleMs == 2000);
        REQUIRE(config.timing.sweepConcurrency == 64);
        REQUIRE(config.timing.tcpConnectTimeoutMs == 300);
        REQUIRE(config.timing.reachabilityTimeoutMs == 200);
        REQUIRE(config.timing.reachabilityConcurrency == 128);
        REQUIRE(config.timing.commandTimeoutSeconds == 10);
        REQUIRE(config.timing.serviceLocationWindowMs == 3000);
        REQUIRE(config.timing.hostnameTimeoutSeconds == 1);
    }

    SECTION("Logging") {
        REQUIRE(config.logging.level == "warn");
        REQUIRE(config.logging.fileLogging);
    }
}

TEST_CASE("ConfigManager load and save", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Missing file writes defaults") {
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));
    }

    SECTION("Saved values survive a reload") {
        {
            ConfigManager manager(testDir.path());
            manager.config().scanner.interfaceName = "wlan0";
            manager.config().scanner.deepScan = true;
            manager.config().timing.sweepSettleMs = 500;
            manager.config().logging.level = "debug";
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.config().scanner.interfaceName == "wlan0");
        REQUIRE(reloaded.config().scanner.deepScan);
        REQUIRE(reloaded.config().timing.sweepSettleMs == 500);
        REQUIRE(reloaded.config().logging.level == "debug");
    }

    SECTION("Partial file keeps defaults for missing keys") {
        testDir.write(R"({"timing": {"ping_timeout_ms": 250}})");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().timing.pingTimeoutMs == 250);
        REQUIRE(manager.config().timing.sweepConcurrency == 64);
        REQUIRE(manager.config().logging.level == "warn");
    }

    SECTION("Invalid JSON keeps defaults") {
        testDir.write("{ not json");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().timing.sweepSettleMs == 2000);
    }

    SECTION("Wrong value type is reported") {
        testDir.write(R"({"scanner": {"deep_scan": "yes"}})");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager JSON layout", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    auto j = manager.toJson();

    REQUIRE(j.contains("scanner"));
    REQUIRE(j.contains("timing"));
    REQUIRE(j.contains("logging"));
    REQUIRE(j["scanner"]["full_scan_paths"].is_array());
    REQUIRE(j["timing"]["command_timeout_seconds"] == 10);
    REQUIRE(j["logging"]["file_logging"] == true);
}

TEST_CASE("ConfigManager::defaultConfigDir", "[ConfigManager]") {
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";

    setenv("XDG_CONFIG_HOME", "/tmp/openfing-xdg", 1);
    REQUIRE(ConfigManager::defaultConfigDir() == std::filesystem::path("/tmp/openfing-xdg/openfing"));

    if (previous) {
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}
