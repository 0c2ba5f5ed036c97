/**
 * @file ProbeParsers.hpp
 * @brief Parsers for the textual output of each discovery probe.
 *
 * Every parser consumes the raw multi-line text of one probe and yields zero or
 * more candidates. Lines that do not match the expected shape, or that fail IP
 * or MAC validation, are skipped; a parser never fails as a whole.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace openfing::core {

/**
 * @brief A device sighting emitted by a parser, before aggregation.
 */
struct ProbeCandidate {
    std::string ip;                     ///< Validated dotted-quad address
    std::optional<std::string> mac;     ///< Canonical MAC, if the probe resolved one
    std::optional<std::string> vendor;  ///< Vendor label supplied by the probe itself
    std::string extra;                  ///< Parser-specific detail (cache name, port, URL)

    bool operator==(const ProbeCandidate& other) const = default;
};

/**
 * @brief Targeted address-cache lookup for a single IP.
 *
 * Returns the canonical MAC for the IP, or nullopt when the cache has no usable
 * entry.
 */
using MacLookup = std::function<std::optional<std::string>(const std::string& ip)>;

/**
 * @brief Parsers for each probe output shape.
 */
class ProbeParsers {
public:
    /**
     * @brief Parses tab-separated full-scan records ("ip<TAB>mac<TAB>vendor").
     *
     * Banner lines ("Interface:", "Starting", "Ending") and lines mentioning
     * "packets" are skipped. "(Unknown...)" vendors become "Unknown" and a
     * trailing "(DUP: n)" marker is stripped. Repeated IPs keep the first record.
     *
     * @param text Raw scan output.
     * @return Candidates carrying ip, mac and vendor.
     */
    static std::vector<ProbeCandidate> parseScanRecords(std::string_view text);

    /**
     * @brief Parses address-cache lines ("name (ip) at mac ...").
     *
     * The token after " at " is used when it is a 17-character address;
     * otherwise the first embedded MAC in the rest of the line is used. Entries
     * without a MAC, or with a broadcast or multicast MAC, are skipped.
     *
     * @param text Raw cache dump, or any probe output with a cache trailer.
     * @return Candidates carrying ip and mac; extra holds the name column.
     */
    static std::vector<ProbeCandidate> parseAddressCache(std::string_view text);

    /**
     * @brief Parses service-location responses for "LOCATION:" headers.
     * @param text Raw responses.
     * @param lookup Targeted cache lookup used to resolve each host's MAC.
     * @return One candidate per distinct host; extra holds the location URL.
     */
    static std::vector<ProbeCandidate> parseServiceLocations(std::string_view text,
                                                             const MacLookup& lookup);

    /**
     * @brief Parses "ip:port" reachability lines.
     * @param text Raw probe output.
     * @param lookup Targeted cache lookup used to resolve each host's MAC.
     * @return One candidate per distinct host; extra holds the first open port.
     */
    static std::vector<ProbeCandidate> parseReachablePorts(std::string_view text,
                                                           const MacLookup& lookup);

    /**
     * @brief Parses name-query output where each responding host is a bare IP line.
     * @param text Raw probe output.
     * @param lookup Targeted cache lookup used to resolve each host's MAC.
     * @return One candidate per distinct host.
     */
    static std::vector<ProbeCandidate> parseNameQuery(std::string_view text,
                                                      const MacLookup& lookup);

    /**
     * @brief Extracts a usable MAC from targeted cache lookup output.
     * @param text Output of a single-entry cache lookup.
     * @return Canonical MAC, or nullopt if none or if broadcast/multicast.
     */
    static std::optional<std::string> macFromCacheEntry(std::string_view text);
};

} // namespace openfing::core
