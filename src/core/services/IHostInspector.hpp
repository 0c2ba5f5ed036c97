/**
 * @file IHostInspector.hpp
 * @brief Interface for per-host lookups used by the deep scan.
 */

#pragma once

#include <cstdint>
#include <string>

namespace openfing::core {

/**
 * @brief Interface for reverse-DNS and TCP connect checks against one host.
 *
 * Both calls are bounded by short, implementation-defined timeouts.
 */
class IHostInspector {
public:
    virtual ~IHostInspector() = default;

    /**
     * @brief Performs a reverse lookup of an address.
     * @param ip Address to resolve.
     * @return Raw resolver output (possibly with a trailing dot), or empty text.
     */
    virtual std::string resolveHostname(const std::string& ip) = 0;

    /**
     * @brief Attempts a TCP connection.
     * @param ip Target address.
     * @param port Target port.
     * @return True if the connection was accepted before the timeout.
     */
    virtual bool tcpConnect(const std::string& ip, uint16_t port) = 0;
};

} // namespace openfing::core
