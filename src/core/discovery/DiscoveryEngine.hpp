/**
 * @file DiscoveryEngine.hpp
 * @brief Orchestrates the privilege-dependent discovery strategies.
 */

#pragma once

#include "core/discovery/DeviceAggregator.hpp"
#include "core/services/IDiscoveryProbes.hpp"
#include "core/services/IHostInspector.hpp"
#include "core/types/DiscoveryReport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace openfing::core {

/**
 * @brief Runs discovery probes, parses their output and aggregates devices.
 *
 * Strategy selection, once per run:
 *  - privileged with the full-scan tool: scan records; done if non-empty.
 *  - privileged otherwise (or empty full scan): liveness sweep, then cache.
 *  - unprivileged: sweep, name service, service location, name query and TCP
 *    reachability stages, each merged before the next starts.
 *
 * All work is synchronous on the calling thread. Probe failures surface only as
 * empty text, so a run never fails; it may return an empty sequence.
 */
class DiscoveryEngine {
public:
    /**
     * @brief Constructs an engine over the given collaborators.
     * @param probes Discovery probe implementation.
     * @param inspector Host inspector used for deep scans.
     * @param interfaceName Interface handed to the full-scan tool.
     */
    DiscoveryEngine(IDiscoveryProbes& probes, IHostInspector& inspector,
                    std::string interfaceName = "");

    /**
     * @brief Discovers devices and returns them ordered by IP.
     * @param subnet Subnet string (e.g., "192.168.1.0/24"); empty if unknown.
     * @param hasPrivilege Whether the caller runs with elevated privileges.
     * @param toolAvailable Whether the full-scan tool is installed.
     * @param deep Whether to resolve hostnames and probe service ports.
     * @return Devices sorted ascending by IP.
     */
    std::vector<Device> discover(const std::string& subnet, bool hasPrivilege, bool toolAvailable,
                                 bool deep);

    /**
     * @brief Same as discover() but also reports the strategy used.
     * @param subnet Subnet string; empty if unknown.
     * @param hasPrivilege Whether the caller runs with elevated privileges.
     * @param toolAvailable Whether the full-scan tool is installed.
     * @param deep Whether to run deep-scan enrichment.
     * @return Report with ordered devices and the scan method.
     */
    DiscoveryReport run(const std::string& subnet, bool hasPrivilege, bool toolAvailable,
                        bool deep);

    /**
     * @brief Ports tried on every host by the unprivileged reachability stage.
     */
    static const std::vector<uint16_t>& reachabilityPorts();

private:
    void runFullScanStage(DeviceAggregator& devices);
    void runSweepStage(DeviceAggregator& devices, const std::string& prefix);
    void runNameServiceStage(DeviceAggregator& devices);
    void runServiceLocationStage(DeviceAggregator& devices);
    void runNameQueryStage(DeviceAggregator& devices, const std::string& prefix);
    void runReachabilityStage(DeviceAggregator& devices, const std::string& prefix);

    MacLookup cacheLookup();

    IDiscoveryProbes& probes_;
    IHostInspector& inspector_;
    std::string interfaceName_;
};

} // namespace openfing::core
