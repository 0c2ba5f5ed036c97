/**
 * @file SystemProbes.hpp
 * @brief Discovery probes backed by system tools and asio sockets.
 */

#pragma once

#include "core/services/IDiscoveryProbes.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/WorkerPool.hpp"
#include "infrastructure/network/SsdpClient.hpp"
#include "infrastructure/network/TcpConnector.hpp"
#include "infrastructure/system/CommandRunner.hpp"
#include "infrastructure/system/Environment.hpp"

#include <string>
#include <vector>

namespace openfing::infra {

/**
 * @brief Discovery probes backed by system tools and asio sockets.
 *
 * Implements the core::IDiscoveryProbes interface. External tools run through
 * CommandRunner; the liveness sweep, TCP reachability and SSDP query run on
 * the WorkerPool pool. Every probe returns empty text on failure.
 */
class SystemProbes : public core::IDiscoveryProbes {
public:
    /**
     * @brief Constructs the probes.
     * @param runner Runner for external tools.
     * @param executor Pool that runs the socket handlers.
     * @param environment Used to locate the full-scan tool.
     * @param timing Probe limits.
     */
    SystemProbes(CommandRunner& runner, WorkerPool& executor, Environment& environment,
                 TimingConfig timing);

    std::string runFullScan(const std::string& interfaceName) override;
    std::string sweepAndReadCache(const std::string& subnetPrefix) override;
    std::string readAddressCache() override;
    std::string lookupCacheEntry(const std::string& ip) override;
    std::string nameServiceBrowse() override;
    std::string serviceLocationQuery() override;
    std::string nameQuery(const std::string& subnetPrefix) override;
    std::string portReachabilityProbe(const std::string& subnetPrefix,
                                      const std::vector<uint16_t>& ports) override;

    /**
     * @brief Host addresses 1-254 under a prefix.
     * @param subnetPrefix Prefix such as "192.168.1.".
     * @return The addresses, or empty if the prefix does not form valid IPv4 addresses.
     */
    static std::vector<std::string> hostAddresses(const std::string& subnetPrefix);

private:
    /**
     * @brief Pings every host on a bounded number of pool tasks.
     *
     * Returns after all hosts answered or the settle interval elapsed,
     * whichever comes first. Hosts not yet started when the interval elapses
     * are skipped.
     */
    void pingSweep(const std::string& subnetPrefix);

    CommandRunner& runner_;
    WorkerPool& executor_;
    Environment& environment_;
    TimingConfig timing_;
    TcpConnector connector_;
    SsdpClient ssdp_;
};

} // namespace openfing::infra
