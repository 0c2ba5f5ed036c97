#include "app/Application.hpp"

#include "app/ReportPrinter.hpp"
#include "core/discovery/DiscoveryEngine.hpp"
#include "infrastructure/export/DeviceExporter.hpp"

#include <boost/program_options.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>

#ifndef OPENFING_VERSION
#define OPENFING_VERSION "1.0.0"
#endif

namespace openfing::app {

Application::Application(int argc, char** argv) {
    initializeLogging();

    std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);
    options_ = parseArguments(args);

    config_ = std::make_unique<infra::ConfigManager>(infra::ConfigManager::defaultConfigDir());
    config_->load();
    applyLoggingConfig();

    initializeComponents();
}

Application::~Application() {
    if (executor_) {
        executor_->shutdown();
    }
    spdlog::debug("OpenFing shutting down");
}

namespace {

namespace po = boost::program_options;

po::options_description visibleOptions(CliOptions& options) {
    po::options_description desc("Options");
    desc.add_options()
        ("deep,d", po::bool_switch(&options.deep), "Resolve hostnames and probe common service ports")
        ("json", po::bool_switch(&options.json), "Print results as JSON")
        ("csv", po::bool_switch(&options.csv), "Print results as CSV")
        ("verbose,v", po::bool_switch(&options.verbose), "Debug logging on stderr")
        ("help,h", po::bool_switch(&options.help), "Show this help");
    return desc;
}

} // namespace

std::optional<CliOptions> Application::parseArguments(const std::vector<std::string>& args) {
    CliOptions options;

    po::options_description hidden;
    hidden.add_options()("interface", po::value<std::string>(&options.interfaceName));

    po::options_description all;
    all.add(visibleOptions(options)).add(hidden);

    po::positional_options_description positional;
    positional.add("interface", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        spdlog::error("Invalid arguments: {}", e.what());
        return std::nullopt;
    }

    if (options.json && options.csv) {
        spdlog::error("--json and --csv are mutually exclusive");
        return std::nullopt;
    }

    return options;
}

std::string Application::usage() {
    CliOptions unused;
    std::ostringstream out;
    out << "Usage: openfing [interface] [options]\n"
        << "\n"
        << "  interface    Network interface to scan (auto-detected if omitted)\n"
        << "\n"
        << visibleOptions(unused);
    return out.str();
}

void Application::initializeLogging() {
    // stdout carries the report, so console logging goes to stderr
    consoleSink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink_->set_level(spdlog::level::warn);

    auto logger = std::make_shared<spdlog::logger>("openfing", consoleSink_);
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
}

void Application::applyLoggingConfig() {
    const auto& logging = config_->config().logging;

    auto level = spdlog::level::from_str(logging.level);
    if (level == spdlog::level::off && logging.level != "off") {
        spdlog::warn("Unknown log level '{}', using warn", logging.level);
        level = spdlog::level::warn;
    }
    if (options_ && options_->verbose) {
        level = spdlog::level::debug;
    }
    consoleSink_->set_level(level);

    if (!logging.fileLogging) {
        return;
    }

    try {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config_->logPath().string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        spdlog::default_logger()->sinks().push_back(fileSink);
        spdlog::debug("OpenFing {} starting, log file: {}", OPENFING_VERSION,
                      config_->logPath().string());
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("File logging disabled: {}", e.what());
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    runner_ = std::make_unique<infra::CommandRunner>(
        std::chrono::seconds(std::max(1, cfg.timing.commandTimeoutSeconds)));
    environment_ = std::make_unique<infra::Environment>(*runner_, cfg.scanner.fullScanPaths);

    // Sweep workers block on child processes, so size the pool for them
    auto threads = std::max<size_t>(std::thread::hardware_concurrency(),
                                    static_cast<size_t>(std::max(1, cfg.timing.sweepConcurrency)));
    executor_ = std::make_unique<infra::WorkerPool>(threads);

    connector_ = std::make_unique<infra::TcpConnector>(*executor_);
    probes_ = std::make_unique<infra::SystemProbes>(*runner_, *executor_, *environment_,
                                                    cfg.timing);
    inspector_ = std::make_unique<infra::HostInspector>(*runner_, *connector_, cfg.timing);

    spdlog::debug("Application components initialized");
}

int Application::run() {
    if (!options_) {
        std::cerr << usage();
        return 2;
    }
    if (options_->help) {
        std::cout << usage();
        return 0;
    }

    const auto& cfg = config_->config();
    bool tableOutput = !options_->json && !options_->csv;
    bool deep = options_->deep || cfg.scanner.deepScan;

    auto requestedInterface =
        options_->interfaceName.empty() ? cfg.scanner.interfaceName : options_->interfaceName;
    auto network = core::NetworkInterfaceEnumerator::detect(requestedInterface);

    bool privileged = environment_->hasPrivilege();
    bool toolAvailable = privileged && environment_->fullScanToolAvailable();

    if (tableOutput) {
        std::cout << ReportPrinter::renderBanner(OPENFING_VERSION);
        std::cout << ReportPrinter::renderNetworkInfo(network, privileged);
        std::cout << "Scanning network for devices...\n\n" << std::flush;
    }

    core::DiscoveryEngine engine(*probes_, *inspector_, network.interfaceName);
    auto report = engine.run(network.subnet, privileged, toolAvailable, deep);

    if (options_->json) {
        std::cout << infra::DeviceExporter::exportToJson(report) << "\n";
        return 0;
    }
    if (options_->csv) {
        std::cout << infra::DeviceExporter::toCsv(report.devices);
        return 0;
    }

    if (report.devices.empty()) {
        std::cerr << "No devices found.\n";
        if (!privileged) {
            std::cerr << "Try running with sudo for a full scan: sudo openfing\n";
        }
        return 0;
    }

    std::cout << ReportPrinter::renderDeviceTable(report, network);
    std::cout << ReportPrinter::renderSummary(report);
    return 0;
}

} // namespace openfing::app
