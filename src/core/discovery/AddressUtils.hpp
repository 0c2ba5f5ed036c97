/**
 * @file AddressUtils.hpp
 * @brief IPv4 validation and MAC address canonicalization.
 *
 * All comparisons between hardware addresses in the discovery engine happen on
 * the canonical form produced here: XX:XX:XX:XX:XX:XX, uppercase, zero-padded.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace openfing::core {

/**
 * @brief Stateless helpers for IPv4 and MAC address handling.
 */
class AddressUtils {
public:
    /**
     * @brief Lenient dotted-quad syntax check.
     *
     * Valid iff the string has exactly three '.' and every other character is a
     * decimal digit. Octet ranges and leading zeros are not checked.
     *
     * @param ip Candidate address.
     * @return True if the string passes the check.
     */
    static bool isValidIPv4(std::string_view ip);

    /**
     * @brief Canonicalizes a hardware address given as a known field.
     *
     * Accepts colon or hyphen separators, single-digit octets and mixed case.
     *
     * @param mac Address such as "b0:41:6f:d:78:17".
     * @return Canonical form, or nullopt if the value is not a six-group address.
     */
    static std::optional<std::string> normalizeMac(std::string_view mac);

    /**
     * @brief Finds the first hardware address embedded in free text.
     *
     * Scans for the first run of colon-delimited groups of 1-2 hex digits that
     * reaches six groups. A run that terminates with fewer groups is rejected and
     * scanning resumes at the next group start.
     *
     * @param text Arbitrary probe output.
     * @return Canonical form of the first match, or nullopt.
     */
    static std::optional<std::string> findMacInText(std::string_view text);

    /**
     * @brief Checks whether a string is already in canonical 17-character form.
     * @param mac Value to check; lowercase hex is accepted.
     * @return True for "xx:xx:xx:xx:xx:xx" shaped input.
     */
    static bool isCanonicalMacShape(std::string_view mac);

    /**
     * @brief Converts a dotted quad to its 32-bit big-endian value.
     *
     * Lenient: non-digit characters other than '.' are ignored.
     *
     * @param ip Dotted-quad string.
     * @return Integer value used for ordering.
     */
    static uint32_t ipToNumber(std::string_view ip);

    /**
     * @brief Checks for broadcast (*.255) and IPv4 multicast (224-239) addresses.
     * @param ip Dotted-quad string.
     * @return True if the address must never become a Device.
     */
    static bool isBroadcastOrMulticastIp(std::string_view ip);

    /**
     * @brief Checks for the all-ones and multicast (01:...) hardware addresses.
     * @param canonicalMac Address in canonical form.
     * @return True if the address must never become a Device.
     */
    static bool isBroadcastOrMulticastMac(std::string_view canonicalMac);

    /**
     * @brief Trims leading and trailing whitespace.
     * @param value Input text.
     * @return View into value without surrounding whitespace.
     */
    static std::string_view trim(std::string_view value);
};

} // namespace openfing::core
