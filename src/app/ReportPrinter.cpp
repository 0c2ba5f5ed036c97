#include "app/ReportPrinter.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>

namespace openfing::app {

namespace {

constexpr std::string_view kRule =
    "+-----------------------------------------------------------------------------+\n";

constexpr size_t kLabelWidth = 34;

std::string orUnknown(const std::string& value) {
    return value.empty() ? "unknown" : value;
}

} // namespace

std::string ReportPrinter::truncate(std::string_view text, size_t width) {
    return std::string(text.substr(0, width));
}

std::string ReportPrinter::renderBanner(std::string_view version) {
    std::string out = "\n";
    out += "+==============================================================================+\n";
    out += fmt::format("|{:^78}|\n", fmt::format("OpenFing v{}", version));
    out += fmt::format("|{:^78}|\n", "Fast Network Scanner for Your Terminal");
    out += "+==============================================================================+\n\n";
    return out;
}

std::string ReportPrinter::renderNetworkInfo(const core::NetworkInfo& network, bool privileged) {
    std::string out = "Network Information:\n--------------------\n";
    out += fmt::format("  Your IP       : {}\n", orUnknown(network.localIp));
    out += fmt::format("  Gateway       : {}\n", orUnknown(network.gatewayIp));
    out += fmt::format("  Subnet        : {}\n", orUnknown(network.subnet));
    out += fmt::format("  Interface     : {}\n", orUnknown(network.interfaceName));
    out += fmt::format("  Running as    : {}\n\n",
                       privileged ? "root/sudo" : "user (limited mode)");

    if (!privileged) {
        out += kRule;
        out += fmt::format("| {:<76}|\n",
                           "NOTE: Running without sudo - multi-method discovery (limited results)");
        out += fmt::format("| {:<76}|\n", "For full network scan, run: sudo openfing");
        out += kRule;
        out += "\n";
    }
    return out;
}

std::string ReportPrinter::deviceLabel(const core::Device& device,
                                       const core::NetworkInfo& network) {
    std::string label;
    if (!network.localIp.empty() && device.ip == network.localIp) {
        label = truncate(device.vendor, 20) + " (THIS DEVICE)";
    } else if (!network.gatewayIp.empty() && device.ip == network.gatewayIp) {
        label = truncate(device.vendor, 22) + " (GATEWAY)";
    } else if (device.hasHostname()) {
        label = device.hostname;
    } else {
        label = device.vendor;
    }
    return truncate(label, kLabelWidth);
}

std::string ReportPrinter::renderDeviceTable(const core::DiscoveryReport& report,
                                             const core::NetworkInfo& network) {
    std::string out(kRule);
    out += fmt::format("| DISCOVERED DEVICES ({} found via {})\n", report.devices.size(),
                       report.methodToString());
    out += kRule;
    out += "\n";

    out += "IP ADDRESS        | MAC ADDRESS        | VENDOR/HOSTNAME                    | PORTS\n";
    out += "------------------+--------------------+------------------------------------+--------\n";

    for (const auto& device : report.devices) {
        std::string ports = device.openPorts.empty() ? "-" : device.openPorts;
        out += fmt::format("{:<17} | {:<18} | {:<34} | {}\n", device.ip, device.mac,
                           deviceLabel(device, network), ports);
    }
    return out;
}

std::string ReportPrinter::renderSummary(const core::DiscoveryReport& report) {
    size_t withMac = 0;
    for (const auto& device : report.devices) {
        if (device.hasResolvedMac()) {
            ++withMac;
        }
    }

    std::string out = "\n";
    out += kRule;
    out += fmt::format("| {:<76}|\n", "SUMMARY");
    out += kRule;
    out += fmt::format("| Total Devices   : {:<58}|\n", report.devices.size());
    out += fmt::format("| With MAC        : {:<58}|\n", withMac);
    out += fmt::format("| Scan Method     : {:<58}|\n", report.methodToString());
    out += kRule;
    out += "\n";

    out += "Device Types (estimated):\n-------------------------\n";

    static constexpr std::array<core::DeviceCategory, 6> order = {
        core::DeviceCategory::Apple,    core::DeviceCategory::Mobile,
        core::DeviceCategory::NetworkEquipment, core::DeviceCategory::Computer,
        core::DeviceCategory::IoT,      core::DeviceCategory::Other};

    auto counts = report.categoryCounts();
    for (auto category : order) {
        auto it = counts.find(category);
        if (it == counts.end() || it->second == 0) {
            continue;
        }
        out += fmt::format("  {:<16}: {}\n", core::Device::categoryToString(category),
                           it->second);
    }
    out += "\n";
    return out;
}

} // namespace openfing::app
