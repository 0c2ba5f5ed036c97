/**
 * @file VendorResolver.hpp
 * @brief Manufacturer lookup from hardware address prefixes.
 */

#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace openfing::core {

/**
 * @brief Resolves a manufacturer label from the OUI of a MAC address.
 *
 * The table holds exact 6-hex-digit prefixes only, so a single hash lookup is
 * enough; no longest-prefix matching is performed.
 */
class VendorResolver {
public:
    /**
     * @brief Looks up the vendor for a hardware address.
     * @param mac Address in any separator style; the first 6 hex digits are used.
     * @return Vendor label, or "Unknown" if the prefix is not known or too short.
     */
    static std::string resolveVendor(std::string_view mac);

    /**
     * @brief Extracts the uppercase 6-digit OUI from an address.
     * @param mac Address in any separator style.
     * @return The OUI, or an empty string if fewer than 6 hex digits precede
     *         the first non-hex, non-separator character.
     */
    static std::string extractOui(std::string_view mac);

    /**
     * @brief Gets the OUI to vendor table.
     * @return Reference to the map of uppercase OUIs to vendor labels.
     */
    static const std::unordered_map<std::string, std::string>& getKnownVendors();
};

} // namespace openfing::core
