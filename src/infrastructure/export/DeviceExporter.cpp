#include "infrastructure/export/DeviceExporter.hpp"

#include <sstream>

namespace openfing::infra {

nlohmann::json DeviceExporter::toJson(const core::DiscoveryReport& report) {
    nlohmann::json j;

    j["scan_method"] = report.methodToString();
    j["deep_scan"] = report.deepScan;
    j["device_count"] = report.devices.size();

    j["categories"] = nlohmann::json::object();
    for (const auto& [category, count] : report.categoryCounts()) {
        j["categories"][core::Device::categoryToString(category)] = count;
    }

    j["devices"] = nlohmann::json::array();
    for (const auto& device : report.devices) {
        nlohmann::json entry;
        entry["ip"] = device.ip;
        entry["mac"] = device.mac;
        entry["vendor"] = device.vendor;
        entry["hostname"] = device.hostname;
        entry["open_ports"] = device.openPorts;
        entry["category"] = core::Device::categoryToString(device.category());
        j["devices"].push_back(entry);
    }

    return j;
}

std::string DeviceExporter::exportToJson(const core::DiscoveryReport& report) {
    return toJson(report).dump(2);
}

std::string DeviceExporter::toCsv(const std::vector<core::Device>& devices) {
    std::ostringstream oss;
    oss << "ip,mac,vendor,hostname,open_ports,category\n";

    for (const auto& d : devices) {
        oss << d.ip << "," << d.mac << "," << escapeCsvField(d.vendor) << ","
            << escapeCsvField(d.hostname) << "," << escapeCsvField(d.openPorts) << ","
            << escapeCsvField(core::Device::categoryToString(d.category())) << "\n";
    }

    return oss.str();
}

std::string DeviceExporter::escapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

} // namespace openfing::infra
