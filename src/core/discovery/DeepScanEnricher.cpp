#include "core/discovery/DeepScanEnricher.hpp"

#include "core/discovery/AddressUtils.hpp"

#include <spdlog/spdlog.h>

namespace openfing::core {

DeepScanEnricher::DeepScanEnricher(IHostInspector& inspector) : inspector_(inspector) {}

void DeepScanEnricher::enrich(std::vector<Device>& devices) {
    spdlog::info("Deep scan of {} devices on {} ports", devices.size(), getServicePorts().size());
    for (auto& device : devices) {
        enrich(device);
    }
}

void DeepScanEnricher::enrich(Device& device) {
    device.hostname = cleanHostname(inspector_.resolveHostname(device.ip));

    std::string openPorts;
    for (const auto& service : getServicePorts()) {
        if (!inspector_.tcpConnect(device.ip, service.port)) {
            continue;
        }
        if (!openPorts.empty()) {
            openPorts += ',';
        }
        openPorts += service.label;
    }
    device.openPorts = std::move(openPorts);

    spdlog::debug("Deep scan {}: hostname={} ports=[{}]", device.ip, device.hostname,
                  device.openPorts);
}

std::string DeepScanEnricher::cleanHostname(const std::string& raw) {
    auto view = AddressUtils::trim(raw);
    auto newline = view.find('\n');
    if (newline != std::string_view::npos) {
        view = view.substr(0, newline);
    }

    view = AddressUtils::trim(view);
    while (!view.empty() && view.back() == '.') {
        view.remove_suffix(1);
    }
    view = AddressUtils::trim(view);

    if (view.empty()) {
        return std::string(kUnresolvedHostname);
    }
    return std::string(view);
}

const std::vector<ServicePort>& DeepScanEnricher::getServicePorts() {
    static const std::vector<ServicePort> ports = {
        {22, "SSH"},   {80, "HTTP"},   {443, "HTTPS"},    {445, "SMB"},     {548, "AFP"},
        {3389, "RDP"}, {5000, "UPnP"}, {8080, "HTTP-Alt"}, {9100, "Print"}, {62078, "iPhone"}};
    return ports;
}

} // namespace openfing::core
