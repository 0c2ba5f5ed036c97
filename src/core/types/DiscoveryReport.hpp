/**
 * @file DiscoveryReport.hpp
 * @brief Result of a discovery run and the strategy that produced it.
 */

#pragma once

#include "core/types/Device.hpp"

#include <map>
#include <string>
#include <vector>

namespace openfing::core {

/**
 * @brief Discovery strategy that produced a run's devices.
 */
enum class ScanMethod : int {
    None = 0,        ///< No strategy produced any device
    FullScan = 1,    ///< Full-scan tool records (privileged)
    PingSweep = 2,   ///< Liveness sweep followed by a cache read (privileged)
    MultiMethod = 3  ///< Unprivileged sequence of sweep, mDNS, SSDP, NetBIOS and TCP stages
};

/**
 * @brief Ordered devices plus summary information for one run.
 */
struct DiscoveryReport {
    std::vector<Device> devices;          ///< Devices sorted ascending by IP
    ScanMethod method{ScanMethod::None};  ///< Strategy that ran last
    bool deepScan{false};                 ///< Whether deep-scan enrichment was applied

    /**
     * @brief Converts the scan method to the label shown to users.
     * @return Label such as "arp-scan (full scan)".
     */
    [[nodiscard]] std::string methodToString() const;

    /**
     * @brief Converts a ScanMethod to its label.
     * @param method The method to convert.
     * @return Human-readable label.
     */
    static std::string scanMethodToString(ScanMethod method);

    /**
     * @brief Counts devices per category.
     * @return Map from category to count; categories with no devices are omitted.
     */
    [[nodiscard]] std::map<DeviceCategory, size_t> categoryCounts() const;

    bool operator==(const DiscoveryReport& other) const = default;
};

} // namespace openfing::core
