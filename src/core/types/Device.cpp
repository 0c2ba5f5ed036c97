#include "core/types/Device.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace openfing::core {

namespace {

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

bool containsAny(std::string_view vendor, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [vendor](std::string_view n) { return containsIgnoreCase(vendor, n); });
}

} // namespace

bool Device::hasResolvedMac() const {
    return !mac.empty() && mac != kUnknownMac;
}

bool Device::hasHostname() const {
    return !hostname.empty() && hostname != kUnresolvedHostname;
}

DeviceCategory Device::category() const {
    return categorize(vendor);
}

DeviceCategory Device::categorize(std::string_view vendor) {
    if (containsAny(vendor, {"apple", "iphone", "ipad"}))
        return DeviceCategory::Apple;
    if (containsAny(vendor, {"samsung", "huawei", "xiaomi", "oppo", "oneplus"}))
        return DeviceCategory::Mobile;
    if (containsAny(vendor,
                    {"cisco", "netgear", "tp-link", "asus", "linksys", "ubiquiti", "mikrotik"}))
        return DeviceCategory::NetworkEquipment;
    if (containsAny(vendor, {"dell", "hp", "lenovo", "intel", "realtek", "microsoft"}))
        return DeviceCategory::Computer;
    if (containsAny(vendor, {"espressif", "tuya", "amazon", "google", "nest", "ring", "sonos"}))
        return DeviceCategory::IoT;
    return DeviceCategory::Other;
}

std::string Device::categoryToString(DeviceCategory category) {
    switch (category) {
    case DeviceCategory::Apple:
        return "Apple Devices";
    case DeviceCategory::Mobile:
        return "Android/Mobile";
    case DeviceCategory::NetworkEquipment:
        return "Network Equip.";
    case DeviceCategory::Computer:
        return "Computers";
    case DeviceCategory::IoT:
        return "IoT/Smart Home";
    case DeviceCategory::Other:
        return "Other/Unknown";
    }
    return "Other/Unknown";
}

} // namespace openfing::core
