/**
 * @file DeepScanEnricher.hpp
 * @brief Optional hostname and open-port enrichment for discovered devices.
 */

#pragma once

#include "core/services/IHostInspector.hpp"
#include "core/types/Device.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace openfing::core {

/**
 * @brief A port probed during deep scan and the label reported when it is open.
 */
struct ServicePort {
    uint16_t port{0};  ///< TCP port number
    std::string label; ///< Service label shown in results (e.g., "SSH")
};

/**
 * @brief Attaches reverse-DNS names and open service ports to devices.
 *
 * Runs after the device set is final; it never adds or removes devices. Cost is
 * one lookup plus one connect per listed port for every device.
 */
class DeepScanEnricher {
public:
    /**
     * @brief Constructs an enricher using the given host inspector.
     * @param inspector Collaborator performing lookups and connects.
     */
    explicit DeepScanEnricher(IHostInspector& inspector);

    /**
     * @brief Enriches every device in place, in order.
     * @param devices Ordered device set.
     */
    void enrich(std::vector<Device>& devices);

    /**
     * @brief Enriches a single device in place.
     * @param device Device to update.
     */
    void enrich(Device& device);

    /**
     * @brief Cleans raw resolver output into a hostname.
     *
     * Uses the first line, trims whitespace and a trailing dot.
     *
     * @param raw Resolver output.
     * @return Hostname, or the unresolved sentinel if nothing is left.
     */
    static std::string cleanHostname(const std::string& raw);

    /**
     * @brief Gets the ordered list of ports probed for each device.
     * @return Reference to the fixed port list.
     */
    static const std::vector<ServicePort>& getServicePorts();

private:
    IHostInspector& inspector_;
};

} // namespace openfing::core
