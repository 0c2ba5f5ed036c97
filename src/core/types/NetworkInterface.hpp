/**
 * @file NetworkInterface.hpp
 * @brief Local network interface and subnet information.
 *
 * This file defines the structures describing the local side of a scan (which
 * interface and subnet to probe) along with a utility class for enumerating
 * system interfaces and the default route.
 */

#pragma once

#include <string>
#include <vector>

namespace openfing::core {

/**
 * @brief Represents an IPv4-configured system network interface.
 */
struct NetworkInterface {
    std::string name;        ///< System name of the interface (e.g., "eth0", "en0")
    std::string ipAddress;   ///< IPv4 address assigned to the interface
    bool isUp{false};        ///< Whether the interface is currently up
    bool isLoopback{false};  ///< Whether this is a loopback interface

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Local network context for one discovery run.
 *
 * Any field may be empty when detection failed; the discovery engine degrades
 * to cache-only probing when the subnet is unknown.
 */
struct NetworkInfo {
    std::string localIp;        ///< Address of this machine
    std::string gatewayIp;      ///< Default gateway address
    std::string subnet;         ///< Subnet in "a.b.c.0/24" form
    std::string interfaceName;  ///< Interface used for probing

    /**
     * @brief Derives a /24 subnet string from a host address.
     * @param address Dotted-quad host address (e.g., "192.168.1.23").
     * @return "a.b.c.0/24", or an empty string if the address has no '.'.
     */
    static std::string subnetFromAddress(const std::string& address);

    /**
     * @brief Extracts the network prefix used to build host addresses.
     *
     * Takes the substring up to and including the last '.' before any '/'.
     *
     * @param subnet Subnet string (e.g., "192.168.1.0/24").
     * @return Prefix such as "192.168.1.", or empty if the subnet is unknown.
     */
    static std::string networkPrefix(const std::string& subnet);

    bool operator==(const NetworkInfo& other) const = default;
};

/**
 * @brief Utility class for enumerating network interfaces and routes.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates all IPv4 interfaces on the system.
     * @return Vector of NetworkInterface objects.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Reads the default IPv4 gateway.
     * @return Gateway address, or an empty string if it cannot be determined.
     */
    static std::string defaultGateway();

    /**
     * @brief Builds the network context for a scan.
     * @param preferredInterface Interface requested by the user; empty to auto-select.
     * @return Detected NetworkInfo. Unknown fields are left empty.
     */
    static NetworkInfo detect(const std::string& preferredInterface);
};

} // namespace openfing::core
