/**
 * @file Device.hpp
 * @brief Discovered device definition and category types.
 *
 * This file defines the Device structure which represents a single host found
 * on the local network during a discovery run, and the coarse category used to
 * summarize a scan.
 */

#pragma once

#include <string>
#include <string_view>

namespace openfing::core {

/**
 * @brief Estimated kind of a discovered device, derived from its vendor label.
 */
enum class DeviceCategory : int {
    Apple = 0,            ///< Apple phones, tablets and computers
    Mobile = 1,           ///< Android and other mobile handsets
    NetworkEquipment = 2, ///< Routers, switches and access points
    Computer = 3,         ///< Desktops, laptops and servers
    IoT = 4,              ///< Smart home and embedded devices
    Other = 5             ///< Anything that could not be classified
};

/// MAC value stored when a probe proved liveness but no hardware address was found.
inline constexpr std::string_view kUnknownMac = "unknown";

/// Vendor label used when the OUI is not in the table.
inline constexpr std::string_view kUnknownVendor = "Unknown";

/// Hostname value stored until a reverse lookup succeeds.
inline constexpr std::string_view kUnresolvedHostname = "?";

/**
 * @brief Represents a device discovered on the local network.
 *
 * A Device is created the first time any probe reports its IP and is mutated in
 * place by later stages of the same run (MAC upgrade, deep-scan enrichment).
 */
struct Device {
    std::string ip;                                   ///< Dotted-quad IPv4 address, unique per run
    std::string mac{kUnknownMac};                     ///< Canonical XX:XX:XX:XX:XX:XX or kUnknownMac
    std::string vendor{kUnknownVendor};               ///< Manufacturer label
    std::string hostname{kUnresolvedHostname};        ///< Reverse-DNS name (deep scan only)
    std::string openPorts;                            ///< Comma-joined service labels (deep scan only)

    /**
     * @brief Checks whether the device carries a real hardware address.
     * @return True if mac is not the unknown sentinel.
     */
    [[nodiscard]] bool hasResolvedMac() const;

    /**
     * @brief Checks whether a reverse lookup produced a hostname.
     * @return True if hostname is set and not the unresolved sentinel.
     */
    [[nodiscard]] bool hasHostname() const;

    /**
     * @brief Estimates the device category from the vendor label.
     * @return The matching DeviceCategory.
     */
    [[nodiscard]] DeviceCategory category() const;

    /**
     * @brief Classifies a vendor label.
     * @param vendor Vendor label, matched case-insensitively by substring.
     * @return The first matching category, or DeviceCategory::Other.
     */
    static DeviceCategory categorize(std::string_view vendor);

    /**
     * @brief Converts a category to a display string.
     * @param category The category to convert.
     * @return Human-readable name (e.g. "Network Equipment").
     */
    static std::string categoryToString(DeviceCategory category);

    bool operator==(const Device& other) const = default;
};

} // namespace openfing::core
