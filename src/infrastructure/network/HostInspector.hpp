/**
 * @file HostInspector.hpp
 * @brief Reverse name lookups and service-port checks for deep scans.
 */

#pragma once

#include "core/services/IHostInspector.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/TcpConnector.hpp"
#include "infrastructure/system/CommandRunner.hpp"

namespace openfing::infra {

/**
 * @brief Reverse lookups through `dig`/`getent` and TCP connects through asio.
 *
 * Implements the core::IHostInspector interface for deep scans.
 */
class HostInspector : public core::IHostInspector {
public:
    HostInspector(CommandRunner& runner, TcpConnector& connector, const TimingConfig& timing);

    /**
     * @brief Resolves a PTR name, trying `dig -x` first and `getent hosts` second.
     * @param ip Address to resolve.
     * @return Resolver output, or empty text if neither tool answered.
     */
    std::string resolveHostname(const std::string& ip) override;

    bool tcpConnect(const std::string& ip, uint16_t port) override;

private:
    CommandRunner& runner_;
    TcpConnector& connector_;
    int hostnameTimeoutSeconds_;
    std::chrono::milliseconds connectTimeout_;
};

} // namespace openfing::infra
