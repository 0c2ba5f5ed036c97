#pragma once

#include "core/types/DiscoveryReport.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace openfing::infra {

/**
 * @brief Serializes discovery results for machine consumption.
 */
class DeviceExporter {
public:
    /**
     * @brief Builds the JSON document for a run.
     *
     * Top-level keys: scan_method, deep_scan, device_count, categories and
     * devices. Each device carries ip, mac, vendor, hostname, open_ports and
     * category.
     */
    static nlohmann::json toJson(const core::DiscoveryReport& report);

    /**
     * @brief JSON document pretty-printed with two-space indentation.
     */
    static std::string exportToJson(const core::DiscoveryReport& report);

    /**
     * @brief Renders devices as CSV with a header row.
     *
     * Fields containing commas, quotes or newlines are quoted.
     */
    static std::string toCsv(const std::vector<core::Device>& devices);

    static std::string escapeCsvField(const std::string& field);
};

} // namespace openfing::infra
