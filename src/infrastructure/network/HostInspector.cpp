#include "infrastructure/network/HostInspector.hpp"

#include "core/discovery/AddressUtils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace openfing::infra {

HostInspector::HostInspector(CommandRunner& runner, TcpConnector& connector,
                             const TimingConfig& timing)
    : runner_(runner), connector_(connector),
      hostnameTimeoutSeconds_(std::max(1, timing.hostnameTimeoutSeconds)),
      connectTimeout_(timing.tcpConnectTimeoutMs) {}

std::string HostInspector::resolveHostname(const std::string& ip) {
    if (!core::AddressUtils::isValidIPv4(ip)) {
        return {};
    }

    auto answer = runner_.captureOutput("dig +short +time=" +
                                        std::to_string(hostnameTimeoutSeconds_) +
                                        " +tries=1 -x " + ip + " 2>/dev/null");
    if (!core::AddressUtils::trim(answer).empty()) {
        return answer;
    }

    answer = runner_.captureOutput("getent hosts " + ip + " 2>/dev/null | awk '{print $2}'");
    if (answer.empty()) {
        spdlog::debug("No reverse name for {}", ip);
    }
    return answer;
}

bool HostInspector::tcpConnect(const std::string& ip, uint16_t port) {
    return connector_.connect(ip, port, connectTimeout_);
}

} // namespace openfing::infra
