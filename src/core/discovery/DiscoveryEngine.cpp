#include "core/discovery/DiscoveryEngine.hpp"

#include "core/discovery/DeepScanEnricher.hpp"
#include "core/discovery/ProbeParsers.hpp"
#include "core/types/NetworkInterface.hpp"

#include <spdlog/spdlog.h>

namespace openfing::core {

namespace {

void logStage(const char* stage, size_t before, const DeviceAggregator& devices) {
    spdlog::debug("Stage '{}' complete: {} devices total ({} new)", stage,
                  devices.size(), devices.size() - before);
}

} // namespace

DiscoveryEngine::DiscoveryEngine(IDiscoveryProbes& probes, IHostInspector& inspector,
                                 std::string interfaceName)
    : probes_(probes), inspector_(inspector), interfaceName_(std::move(interfaceName)) {}

std::vector<Device> DiscoveryEngine::discover(const std::string& subnet, bool hasPrivilege,
                                              bool toolAvailable, bool deep) {
    return run(subnet, hasPrivilege, toolAvailable, deep).devices;
}

DiscoveryReport DiscoveryEngine::run(const std::string& subnet, bool hasPrivilege,
                                     bool toolAvailable, bool deep) {
    DiscoveryReport report;
    report.deepScan = deep;

    DeviceAggregator devices;
    auto prefix = NetworkInfo::networkPrefix(subnet);
    if (prefix.empty()) {
        spdlog::warn("Subnet unknown, sweep stages will read the address cache only");
    }

    if (hasPrivilege) {
        if (toolAvailable) {
            spdlog::info("Running full scan on interface '{}'", interfaceName_);
            runFullScanStage(devices);
            report.method = ScanMethod::FullScan;
        }
        if (devices.empty()) {
            spdlog::info("Full scan unavailable or empty, using ping sweep");
            runSweepStage(devices, prefix);
            report.method = ScanMethod::PingSweep;
        }
    } else {
        spdlog::info("Running unprivileged multi-method discovery");
        report.method = ScanMethod::MultiMethod;
        runSweepStage(devices, prefix);
        runNameServiceStage(devices);
        runServiceLocationStage(devices);
        if (!prefix.empty()) {
            runNameQueryStage(devices, prefix);
            runReachabilityStage(devices, prefix);
        }
    }

    report.devices = devices.sortedDevices();
    spdlog::info("Discovery found {} devices via {}", report.devices.size(),
                 report.methodToString());

    if (deep && !report.devices.empty()) {
        DeepScanEnricher enricher(inspector_);
        enricher.enrich(report.devices);
    }

    return report;
}

const std::vector<uint16_t>& DiscoveryEngine::reachabilityPorts() {
    static const std::vector<uint16_t> ports = {22, 80, 443};
    return ports;
}

void DiscoveryEngine::runFullScanStage(DeviceAggregator& devices) {
    auto before = devices.size();
    auto output = probes_.runFullScan(interfaceName_);
    if (output.empty()) {
        spdlog::debug("Full scan produced no output");
    }
    devices.mergeAll(ProbeParsers::parseScanRecords(output));
    logStage("full scan", before, devices);
}

void DiscoveryEngine::runSweepStage(DeviceAggregator& devices, const std::string& prefix) {
    auto before = devices.size();
    auto output = prefix.empty() ? probes_.readAddressCache() : probes_.sweepAndReadCache(prefix);
    devices.mergeAll(ProbeParsers::parseAddressCache(output));
    logStage("ping sweep", before, devices);
}

void DiscoveryEngine::runNameServiceStage(DeviceAggregator& devices) {
    auto before = devices.size();
    auto output = probes_.nameServiceBrowse();
    if (output.empty()) {
        spdlog::debug("Name-service browse unavailable");
        return;
    }
    devices.mergeAll(ProbeParsers::parseAddressCache(output));
    logStage("name service", before, devices);
}

void DiscoveryEngine::runServiceLocationStage(DeviceAggregator& devices) {
    auto before = devices.size();
    auto output = probes_.serviceLocationQuery();
    if (output.empty()) {
        spdlog::debug("Service-location query produced no output");
        return;
    }
    devices.mergeAll(ProbeParsers::parseServiceLocations(output, cacheLookup()));
    devices.mergeAll(ProbeParsers::parseAddressCache(output));
    logStage("service location", before, devices);
}

void DiscoveryEngine::runNameQueryStage(DeviceAggregator& devices, const std::string& prefix) {
    auto before = devices.size();
    auto output = probes_.nameQuery(prefix);
    if (output.empty()) {
        spdlog::debug("Name query unavailable, skipping");
        return;
    }
    devices.mergeAll(ProbeParsers::parseNameQuery(output, cacheLookup()));
    devices.mergeAll(ProbeParsers::parseAddressCache(output));
    logStage("name query", before, devices);
}

void DiscoveryEngine::runReachabilityStage(DeviceAggregator& devices, const std::string& prefix) {
    auto before = devices.size();
    auto output = probes_.portReachabilityProbe(prefix, reachabilityPorts());
    if (output.empty()) {
        spdlog::debug("Reachability probe produced no output");
        return;
    }
    devices.mergeAll(ProbeParsers::parseReachablePorts(output, cacheLookup()));
    devices.mergeAll(ProbeParsers::parseAddressCache(output));
    logStage("tcp reachability", before, devices);
}

MacLookup DiscoveryEngine::cacheLookup() {
    return [this](const std::string& ip) {
        return ProbeParsers::macFromCacheEntry(probes_.lookupCacheEntry(ip));
    };
}

} // namespace openfing::core
