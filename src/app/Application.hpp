#pragma once

#include "core/types/NetworkInterface.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/WorkerPool.hpp"
#include "infrastructure/network/HostInspector.hpp"
#include "infrastructure/network/SystemProbes.hpp"
#include "infrastructure/network/TcpConnector.hpp"
#include "infrastructure/system/CommandRunner.hpp"
#include "infrastructure/system/Environment.hpp"

#include <memory>
#include <optional>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

namespace openfing::app {

/**
 * @brief Options given on the command line.
 */
struct CliOptions {
    std::string interfaceName;  ///< Positional interface argument; empty to auto-detect.
    bool deep{false};           ///< --deep: resolve hostnames and probe service ports.
    bool json{false};           ///< --json: print the JSON report instead of the table.
    bool csv{false};            ///< --csv: print CSV instead of the table.
    bool verbose{false};        ///< --verbose: debug logging on stderr.
    bool help{false};           ///< --help: print usage and exit.
};

class Application {
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

    /**
     * @brief Parses command-line arguments (without the program name).
     * @return Parsed options, or nullopt on an unknown flag or a second positional argument.
     */
    static std::optional<CliOptions> parseArguments(const std::vector<std::string>& args);

    static std::string usage();

    infra::ConfigManager& config() { return *config_; }

private:
    void initializeLogging();
    void applyLoggingConfig();
    void initializeComponents();

    std::optional<CliOptions> options_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> consoleSink_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::CommandRunner> runner_;
    std::unique_ptr<infra::Environment> environment_;
    std::unique_ptr<infra::WorkerPool> executor_;
    std::unique_ptr<infra::TcpConnector> connector_;
    std::unique_ptr<infra::SystemProbes> probes_;
    std::unique_ptr<infra::HostInspector> inspector_;
};

} // namespace openfing::app
