/**
 * @file DeviceAggregator.hpp
 * @brief Deduplicating accumulator for devices found during one discovery run.
 */

#pragma once

#include "core/discovery/ProbeParsers.hpp"
#include "core/types/Device.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace openfing::core {

/**
 * @brief Outcome of merging one candidate into the aggregate set.
 */
enum class MergeOutcome {
    Added,     ///< A new Device was created for the IP
    Upgraded,  ///< An existing Device had its unknown MAC replaced
    Unchanged, ///< The IP was already known and nothing was replaced
    Rejected   ///< The candidate failed validation and was dropped
};

/**
 * @brief Accumulates probe candidates into a set keyed by IP.
 *
 * The first stage to report an IP decides its MAC and vendor. A later candidate
 * only replaces the MAC when the stored one is the unknown sentinel and the new
 * one is a real address; vendor is recomputed after every MAC assignment.
 */
class DeviceAggregator {
public:
    /**
     * @brief Merges a single candidate.
     * @param candidate Parser output.
     * @return What happened to the aggregate set.
     */
    MergeOutcome merge(const ProbeCandidate& candidate);

    /**
     * @brief Merges a batch of candidates in order.
     * @param candidates Parser output.
     * @return Number of candidates that added or upgraded a Device.
     */
    size_t mergeAll(const std::vector<ProbeCandidate>& candidates);

    /**
     * @brief Number of distinct devices collected so far.
     */
    [[nodiscard]] size_t size() const { return devices_.size(); }

    /**
     * @brief Whether no device has been collected.
     */
    [[nodiscard]] bool empty() const { return devices_.empty(); }

    /**
     * @brief Looks up a device by IP.
     * @param ip Dotted-quad address.
     * @return Pointer to the stored device, or nullptr.
     */
    [[nodiscard]] const Device* find(const std::string& ip) const;

    /**
     * @brief Returns the devices sorted ascending by numeric IP value.
     * @return Copy of the collected devices in deterministic order.
     */
    [[nodiscard]] std::vector<Device> sortedDevices() const;

    /**
     * @brief Sorts devices ascending by the 32-bit value of their IP.
     * @param devices Devices to sort in place.
     */
    static void sortByIp(std::vector<Device>& devices);

private:
    static void assignMac(Device& device, const ProbeCandidate& candidate);

    std::vector<Device> devices_;
    std::unordered_map<std::string, size_t> indexByIp_;
};

} // namespace openfing::core
