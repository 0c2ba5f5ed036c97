/**
 * @file ReportPrinter.hpp
 * @brief Renders the terminal view of a discovery run.
 */

#pragma once

#include "core/types/DiscoveryReport.hpp"
#include "core/types/NetworkInterface.hpp"

#include <string>
#include <string_view>

namespace openfing::app {

/**
 * @brief Formats network details, the device table and the summary blocks.
 *
 * All functions return text; the caller decides which stream it goes to.
 */
class ReportPrinter {
public:
    static std::string renderBanner(std::string_view version);

    /**
     * @brief Lists local IP, gateway, subnet, interface and privilege mode.
     */
    static std::string renderNetworkInfo(const core::NetworkInfo& network, bool privileged);

    /**
     * @brief Renders the header box and one row per device.
     */
    static std::string renderDeviceTable(const core::DiscoveryReport& report,
                                         const core::NetworkInfo& network);

    /**
     * @brief Renders the totals box and the estimated device-type breakdown.
     *
     * Categories with no devices are omitted.
     */
    static std::string renderSummary(const core::DiscoveryReport& report);

    /**
     * @brief Chooses the VENDOR/HOSTNAME cell for a device.
     *
     * The local machine and the gateway are marked; otherwise a resolved
     * hostname wins over the vendor.
     */
    static std::string deviceLabel(const core::Device& device, const core::NetworkInfo& network);

    static std::string truncate(std::string_view text, size_t width);
};

} // namespace openfing::app
