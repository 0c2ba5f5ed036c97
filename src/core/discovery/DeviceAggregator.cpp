#include "core/discovery/DeviceAggregator.hpp"

#include "core/discovery/AddressUtils.hpp"
#include "core/discovery/VendorResolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace openfing::core {

void DeviceAggregator::assignMac(Device& device, const ProbeCandidate& candidate) {
    device.mac = *candidate.mac;
    if (candidate.vendor && !candidate.vendor->empty() && *candidate.vendor != kUnknownVendor) {
        device.vendor = *candidate.vendor;
    } else {
        device.vendor = VendorResolver::resolveVendor(device.mac);
    }
}

MergeOutcome DeviceAggregator::merge(const ProbeCandidate& candidate) {
    if (!AddressUtils::isValidIPv4(candidate.ip) ||
        AddressUtils::isBroadcastOrMulticastIp(candidate.ip)) {
        return MergeOutcome::Rejected;
    }

    // Parsers emit canonical MACs; anything else is treated as unresolved.
    ProbeCandidate normalized = candidate;
    if (normalized.mac) {
        auto canonical = AddressUtils::normalizeMac(*normalized.mac);
        if (!canonical) {
            normalized.mac.reset();
        } else if (AddressUtils::isBroadcastOrMulticastMac(*canonical)) {
            return MergeOutcome::Rejected;
        } else {
            normalized.mac = std::move(canonical);
        }
    }

    auto it = indexByIp_.find(normalized.ip);
    if (it == indexByIp_.end()) {
        Device device;
        device.ip = normalized.ip;
        if (normalized.mac) {
            assignMac(device, normalized);
        }
        indexByIp_.emplace(device.ip, devices_.size());
        devices_.push_back(std::move(device));
        return MergeOutcome::Added;
    }

    auto& existing = devices_[it->second];
    if (!existing.hasResolvedMac() && normalized.mac) {
        assignMac(existing, normalized);
        spdlog::debug("Resolved MAC for {}: {} ({})", existing.ip, existing.mac, existing.vendor);
        return MergeOutcome::Upgraded;
    }

    return MergeOutcome::Unchanged;
}

size_t DeviceAggregator::mergeAll(const std::vector<ProbeCandidate>& candidates) {
    size_t changed = 0;
    for (const auto& candidate : candidates) {
        auto outcome = merge(candidate);
        if (outcome == MergeOutcome::Added || outcome == MergeOutcome::Upgraded) {
            ++changed;
        }
    }
    return changed;
}

const Device* DeviceAggregator::find(const std::string& ip) const {
    auto it = indexByIp_.find(ip);
    return it != indexByIp_.end() ? &devices_[it->second] : nullptr;
}

std::vector<Device> DeviceAggregator::sortedDevices() const {
    auto devices = devices_;
    sortByIp(devices);
    return devices;
}

void DeviceAggregator::sortByIp(std::vector<Device>& devices) {
    std::stable_sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) {
        return AddressUtils::ipToNumber(a.ip) < AddressUtils::ipToNumber(b.ip);
    });
}

} // namespace openfing::core
