#include "core/discovery/ProbeParsers.hpp"

#include "core/discovery/AddressUtils.hpp"
#include "core/types/Device.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace openfing::core {

namespace {

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::vector<std::string_view> splitFields(std::string_view line, char delimiter) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        auto end = line.find(delimiter, start);
        if (end == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, end - start));
        start = end + 1;
    }
    return fields;
}

bool startsWith(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

std::string toLower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isUsableIp(std::string_view ip) {
    return AddressUtils::isValidIPv4(ip) && !AddressUtils::isBroadcastOrMulticastIp(ip);
}

std::string cleanScanVendor(std::string_view vendor) {
    vendor = AddressUtils::trim(vendor);

    auto dup = vendor.find("(DUP:");
    if (dup != std::string_view::npos && dup > 0) {
        vendor = vendor.substr(0, dup);
        while (!vendor.empty() && vendor.back() == ' ') {
            vendor.remove_suffix(1);
        }
    }

    if (vendor.empty() || startsWith(vendor, "(Unknown")) {
        return std::string(kUnknownVendor);
    }
    return std::string(vendor);
}

std::optional<std::string> hostFromLocation(std::string_view url) {
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        url = url.substr(scheme + 3);
    }
    auto end = url.find_first_of(":/ \t");
    auto host = url.substr(0, end);
    if (host.empty()) {
        return std::nullopt;
    }
    return std::string(host);
}

ProbeCandidate lookupCandidate(std::string ip, std::string extra, const MacLookup& lookup) {
    ProbeCandidate candidate;
    candidate.mac = lookup ? lookup(ip) : std::nullopt;
    candidate.ip = std::move(ip);
    candidate.extra = std::move(extra);
    return candidate;
}

} // namespace

std::vector<ProbeCandidate> ProbeParsers::parseScanRecords(std::string_view text) {
    static constexpr std::array<std::string_view, 3> kBannerPrefixes = {"Interface:", "Starting",
                                                                        "Ending"};

    std::vector<ProbeCandidate> candidates;
    std::unordered_set<std::string> seen;

    for (auto line : splitLines(text)) {
        if (line.empty()) {
            continue;
        }
        if (std::any_of(kBannerPrefixes.begin(), kBannerPrefixes.end(),
                        [line](std::string_view p) { return startsWith(line, p); })) {
            continue;
        }
        if (line.find("packets") != std::string_view::npos) {
            continue;
        }

        auto fields = splitFields(line, '\t');
        if (fields.size() < 2) {
            continue;
        }

        auto ip = AddressUtils::trim(fields[0]);
        if (!isUsableIp(ip)) {
            continue;
        }

        auto mac = AddressUtils::normalizeMac(fields[1]);
        if (!mac || AddressUtils::isBroadcastOrMulticastMac(*mac)) {
            continue;
        }

        if (!seen.insert(std::string(ip)).second) {
            continue;
        }

        ProbeCandidate candidate;
        candidate.ip = std::string(ip);
        candidate.mac = std::move(mac);
        candidate.vendor = cleanScanVendor(fields.size() > 2 ? fields[2] : std::string_view{});
        candidates.push_back(std::move(candidate));
    }

    spdlog::debug("Scan-record parser produced {} candidates", candidates.size());
    return candidates;
}

std::vector<ProbeCandidate> ProbeParsers::parseAddressCache(std::string_view text) {
    std::vector<ProbeCandidate> candidates;

    for (auto line : splitLines(text)) {
        auto ipStart = line.find('(');
        if (ipStart == std::string_view::npos) {
            continue;
        }
        auto ipEnd = line.find(')', ipStart);
        if (ipEnd == std::string_view::npos) {
            continue;
        }

        auto ip = AddressUtils::trim(line.substr(ipStart + 1, ipEnd - ipStart - 1));
        if (!isUsableIp(ip)) {
            continue;
        }

        std::optional<std::string> mac;
        auto at = line.find(" at ", ipEnd);
        if (at != std::string_view::npos) {
            auto tokenStart = at + 4;
            auto tokenEnd = line.find(' ', tokenStart);
            auto token = line.substr(tokenStart, tokenEnd == std::string_view::npos
                                                     ? std::string_view::npos
                                                     : tokenEnd - tokenStart);
            if (AddressUtils::isCanonicalMacShape(token)) {
                mac = AddressUtils::normalizeMac(token);
            }
        }
        if (!mac) {
            mac = AddressUtils::findMacInText(line.substr(ipEnd + 1));
        }
        if (!mac || AddressUtils::isBroadcastOrMulticastMac(*mac)) {
            continue;
        }

        ProbeCandidate candidate;
        candidate.ip = std::string(ip);
        candidate.mac = std::move(mac);
        candidate.extra = std::string(AddressUtils::trim(line.substr(0, ipStart)));
        candidates.push_back(std::move(candidate));
    }

    spdlog::debug("Address-cache parser produced {} candidates", candidates.size());
    return candidates;
}

std::vector<ProbeCandidate> ProbeParsers::parseServiceLocations(std::string_view text,
                                                                const MacLookup& lookup) {
    static constexpr std::string_view kField = "location:";

    std::vector<ProbeCandidate> candidates;
    std::unordered_set<std::string> seen;

    for (auto line : splitLines(text)) {
        auto pos = toLower(line).find(kField);
        if (pos == std::string::npos) {
            continue;
        }

        auto url = AddressUtils::trim(line.substr(pos + kField.size()));
        auto host = hostFromLocation(url);
        if (!host || !isUsableIp(*host)) {
            continue;
        }
        if (!seen.insert(*host).second) {
            continue;
        }

        candidates.push_back(lookupCandidate(std::move(*host), std::string(url), lookup));
    }

    spdlog::debug("Service-location parser produced {} candidates", candidates.size());
    return candidates;
}

std::vector<ProbeCandidate> ProbeParsers::parseReachablePorts(std::string_view text,
                                                              const MacLookup& lookup) {
    std::vector<ProbeCandidate> candidates;
    std::unordered_set<std::string> seen;

    for (auto line : splitLines(text)) {
        line = AddressUtils::trim(line);
        auto colon = line.rfind(':');
        if (colon == std::string_view::npos) {
            continue;
        }

        auto ip = line.substr(0, colon);
        auto port = line.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(), [](char c) {
                return c >= '0' && c <= '9';
            })) {
            continue;
        }
        if (!isUsableIp(ip)) {
            continue;
        }
        if (!seen.insert(std::string(ip)).second) {
            continue;
        }

        candidates.push_back(lookupCandidate(std::string(ip), std::string(port), lookup));
    }

    spdlog::debug("Reachability parser produced {} candidates", candidates.size());
    return candidates;
}

std::vector<ProbeCandidate> ProbeParsers::parseNameQuery(std::string_view text,
                                                         const MacLookup& lookup) {
    std::vector<ProbeCandidate> candidates;
    std::unordered_set<std::string> seen;

    for (auto line : splitLines(text)) {
        auto ip = AddressUtils::trim(line);
        if (!isUsableIp(ip)) {
            continue;
        }
        if (!seen.insert(std::string(ip)).second) {
            continue;
        }

        candidates.push_back(lookupCandidate(std::string(ip), "", lookup));
    }

    spdlog::debug("Name-query parser produced {} candidates", candidates.size());
    return candidates;
}

std::optional<std::string> ProbeParsers::macFromCacheEntry(std::string_view text) {
    auto mac = AddressUtils::findMacInText(text);
    if (!mac || AddressUtils::isBroadcastOrMulticastMac(*mac)) {
        return std::nullopt;
    }
    return mac;
}

} // namespace openfing::core
