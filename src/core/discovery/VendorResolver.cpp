#include "core/discovery/VendorResolver.hpp"

#include "core/types/Device.hpp"

#include <cctype>

namespace openfing::core {

std::string VendorResolver::extractOui(std::string_view mac) {
    std::string oui;
    oui.reserve(6);

    for (char c : mac) {
        if (oui.size() == 6) {
            break;
        }
        if (c == ':' || c == '-') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return "";
        }
        oui.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    return oui.size() == 6 ? oui : "";
}

std::string VendorResolver::resolveVendor(std::string_view mac) {
    auto oui = extractOui(mac);
    if (oui.empty()) {
        return std::string(kUnknownVendor);
    }

    const auto& vendors = getKnownVendors();
    auto it = vendors.find(oui);
    return it != vendors.end() ? it->second : std::string(kUnknownVendor);
}

const std::unordered_map<std::string, std::string>& VendorResolver::getKnownVendors() {
    static const std::unordered_map<std::string, std::string> vendors = {
        // Virtualization
        {"00163E", "VMware"}, {"000C29", "VMware"}, {"005056", "VMware"},

        {"0017F2", "Apple"}, {"002481", "Apple"}, {"00037A", "Apple"},
        {"ACDE48", "Apple"}, {"D0817A", "Apple"}, {"F0D1A9", "Apple"},
        {"5C5027", "Apple"}, {"F0B479", "Apple"}, {"ACBC32", "Apple"},
        {"7CD1C3", "Apple"}, {"A4B197", "Apple"}, {"3C06A7", "Apple"},
        {"4C20B8", "Apple"},

        {"9C5C8E", "Samsung"}, {"98D6BB", "Samsung"}, {"C44202", "Samsung"},

        {"B8D7AF", "Huawei"}, {"E8BBA8", "Huawei"}, {"48A472", "Huawei"},
        {"E8EA4D", "Huawei"},

        {"64B473", "Xiaomi"}, {"8CBEBE", "Xiaomi"}, {"F8A45F", "Xiaomi"},

        {"00E04C", "Realtek"}, {"525400", "Realtek"}, {"4CED24", "Realtek"},

        {"001E58", "Intel"}, {"8C8CAA", "Intel"}, {"A4C3F0", "Intel"},

        {"B499BA", "Dell"}, {"F8BC12", "Dell"}, {"4C7625", "Dell"},

        {"3C970E", "HP"}, {"98E7F4", "HP"},

        {"94E6F7", "Lenovo"}, {"C82A14", "Lenovo"}, {"E89216", "Lenovo"},

        {"B0BE76", "TP-Link"}, {"E0E62E", "TP-Link"}, {"6466B3", "TP-Link"},

        {"1062EB", "Netgear"}, {"9CD36D", "Netgear"}, {"C43DC7", "Netgear"},

        {"F832E4", "Cisco"}, {"001D7E", "Cisco"},

        {"2CFDA1", "ASUS"}, {"08606E", "ASUS"}, {"10C37B", "ASUS"},

        {"240DC2", "Espressif"}, {"A020A6", "Espressif"}, {"AC84C6", "Espressif"},

        {"F0272D", "Amazon"}, {"74C246", "Amazon"}, {"A002DC", "Amazon"},

        {"3C5AB4", "Google"}, {"F4F5D8", "Google"}, {"54609A", "Google"},

        {"18B430", "Nest"}, {"64166D", "Nest"},

        {"343EA4", "Ring"},

        {"B8E937", "Sonos"}, {"5CA6E6", "Sonos"}, {"947AF0", "Sonos"},

        {"B827EB", "Raspberry Pi"}, {"DCA632", "Raspberry Pi"}, {"E45F01", "Raspberry Pi"},

        {"001DD8", "Microsoft"}, {"7CB27D", "Microsoft"}, {"98DE00", "Microsoft"},

        {"001FA7", "Sony"}, {"0004FF", "Sony"}, {"F8461C", "Sony"},

        {"002709", "Nintendo"}, {"0022AA", "Nintendo"}, {"E0E751", "Nintendo"},

        {"B8A1B8", "Roku"}, {"D02544", "Roku"}, {"84EA64", "Roku"},

        {"802AA8", "Ubiquiti"}, {"F09FC2", "Ubiquiti"}, {"68D79A", "Ubiquiti"},

        {"4C5E0C", "MikroTik"}, {"D4CA6D", "MikroTik"}, {"E4D332", "MikroTik"},

        {"B0416F", "Shenzhen Maxtang"}};
    return vendors;
}

} // namespace openfing::core
