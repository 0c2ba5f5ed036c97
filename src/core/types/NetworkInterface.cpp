#include "core/types/NetworkInterface.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace openfing::core {

std::string NetworkInfo::subnetFromAddress(const std::string& address) {
    auto lastDot = address.rfind('.');
    if (lastDot == std::string::npos || lastDot == 0) {
        return "";
    }
    return address.substr(0, lastDot) + ".0/24";
}

std::string NetworkInfo::networkPrefix(const std::string& subnet) {
    auto end = subnet.find('/');
    auto head = subnet.substr(0, end);
    auto lastDot = head.rfind('.');
    if (lastDot == std::string::npos || lastDot == 0) {
        return "";
    }
    return head.substr(0, lastDot + 1);
}

std::vector<NetworkInterface> NetworkInterfaceEnumerator::enumerate() {
    std::vector<NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        spdlog::warn("getifaddrs failed, no interfaces available");
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        char ipStr[INET_ADDRSTRLEN];
        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
        iface.ipAddress = ipStr;

        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::string NetworkInterfaceEnumerator::defaultGateway() {
#ifdef __linux__
    std::ifstream routes("/proc/net/route");
    if (!routes) {
        return "";
    }

    std::string line;
    std::getline(routes, line); // header
    while (std::getline(routes, line)) {
        std::istringstream iss(line);
        std::string iface;
        std::string destination;
        std::string gateway;
        if (!(iss >> iface >> destination >> gateway)) {
            continue;
        }
        if (destination != "00000000") {
            continue;
        }

        // /proc/net/route stores addresses as little-endian hex
        in_addr addr{};
        addr.s_addr = static_cast<in_addr_t>(std::strtoul(gateway.c_str(), nullptr, 16));
        char ipStr[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr, ipStr, INET_ADDRSTRLEN);
        return ipStr;
    }
#endif
    return "";
}

NetworkInfo NetworkInterfaceEnumerator::detect(const std::string& preferredInterface) {
    NetworkInfo info;
    info.interfaceName = preferredInterface;

    for (const auto& iface : enumerate()) {
        if (!iface.isUp || iface.isLoopback) {
            continue;
        }
        if (!preferredInterface.empty() && iface.name != preferredInterface) {
            continue;
        }
        info.localIp = iface.ipAddress;
        info.interfaceName = iface.name;
        break;
    }

    if (info.interfaceName.empty()) {
        info.interfaceName = "eth0";
    }

    info.gatewayIp = defaultGateway();
    info.subnet = NetworkInfo::subnetFromAddress(info.localIp);

    spdlog::debug("Network info: ip={} gateway={} subnet={} interface={}", info.localIp,
                  info.gatewayIp, info.subnet, info.interfaceName);
    return info;
}

} // namespace openfing::core
