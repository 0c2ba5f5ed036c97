/**
 * @file IDiscoveryProbes.hpp
 * @brief Interface for the external probes that feed the discovery engine.
 *
 * Each method runs one external probing mechanism and returns its captured
 * text output. Implementations never throw: a probe that cannot start, times
 * out, or exits non-zero returns an empty string.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace openfing::core {

/**
 * @brief Interface for discovery probes.
 *
 * The address cache these probes read is shared operating-system state; the
 * engine only ever sees it through this interface so tests can substitute a
 * deterministic fake.
 */
class IDiscoveryProbes {
public:
    virtual ~IDiscoveryProbes() = default;

    /**
     * @brief Runs the full-scan tool on an interface.
     * @param interfaceName Interface to scan (e.g., "eth0").
     * @return Tab-separated scan records, or empty text on failure.
     */
    virtual std::string runFullScan(const std::string& interfaceName) = 0;

    /**
     * @brief Runs a bounded liveness sweep over hosts 1-254 and dumps the cache.
     * @param subnetPrefix Network prefix such as "192.168.1.".
     * @return Address-cache dump taken after the settle interval.
     */
    virtual std::string sweepAndReadCache(const std::string& subnetPrefix) = 0;

    /**
     * @brief Dumps the address cache without sweeping.
     * @return Address-cache dump.
     */
    virtual std::string readAddressCache() = 0;

    /**
     * @brief Looks up a single address-cache entry.
     * @param ip Address to look up.
     * @return Raw lookup output, or empty text when there is no entry.
     */
    virtual std::string lookupCacheEntry(const std::string& ip) = 0;

    /**
     * @brief Browses the name service (mDNS class).
     * @return Browse output followed by a cache dump, or empty text if the tool is absent.
     */
    virtual std::string nameServiceBrowse() = 0;

    /**
     * @brief Sends a service-location (SSDP class) multicast query.
     * @return Responses with LOCATION headers followed by a cache dump.
     */
    virtual std::string serviceLocationQuery() = 0;

    /**
     * @brief Broadcasts a name query (NetBIOS class) on the subnet.
     * @param subnetPrefix Network prefix such as "192.168.1.".
     * @return One responding IP per line followed by a cache dump, or empty text
     *         if the tool is absent.
     */
    virtual std::string nameQuery(const std::string& subnetPrefix) = 0;

    /**
     * @brief Checks TCP reachability of every host on the subnet.
     * @param subnetPrefix Network prefix such as "192.168.1.".
     * @param ports Ports to try on each host.
     * @return One "ip:port" line per reachable pair followed by a cache dump.
     */
    virtual std::string portReachabilityProbe(const std::string& subnetPrefix,
                                              const std::vector<uint16_t>& ports) = 0;
};

} // namespace openfing::core
