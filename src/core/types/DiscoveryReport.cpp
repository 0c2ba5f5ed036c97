#include "core/types/DiscoveryReport.hpp"

namespace openfing::core {

std::string DiscoveryReport::methodToString() const {
    return scanMethodToString(method);
}

std::string DiscoveryReport::scanMethodToString(ScanMethod method) {
    switch (method) {
    case ScanMethod::None:
        return "none";
    case ScanMethod::FullScan:
        return "arp-scan (full scan)";
    case ScanMethod::PingSweep:
        return "ping sweep + ARP";
    case ScanMethod::MultiMethod:
        return "multi-method";
    }
    return "none";
}

std::map<DeviceCategory, size_t> DiscoveryReport::categoryCounts() const {
    std::map<DeviceCategory, size_t> counts;
    for (const auto& device : devices) {
        ++counts[device.category()];
    }
    return counts;
}

} // namespace openfing::core
