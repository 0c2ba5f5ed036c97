#include "core/discovery/AddressUtils.hpp"

#include <cctype>

namespace openfing::core {

namespace {

constexpr int kMacGroups = 6;

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

void appendGroup(std::string& out, std::string_view group) {
    if (!out.empty()) {
        out.push_back(':');
    }
    if (group.size() == 1) {
        out.push_back('0');
    }
    for (char c : group) {
        out.push_back(upper(c));
    }
}

} // namespace

bool AddressUtils::isValidIPv4(std::string_view ip) {
    int dots = 0;
    for (char c : ip) {
        if (c == '.') {
            ++dots;
        } else if (!isDigit(c)) {
            return false;
        }
    }
    return dots == 3;
}

std::optional<std::string> AddressUtils::normalizeMac(std::string_view mac) {
    mac = trim(mac);

    std::string out;
    out.reserve(17);
    int groups = 0;
    size_t start = 0;

    while (start <= mac.size()) {
        size_t end = start;
        while (end < mac.size() && mac[end] != ':' && mac[end] != '-') {
            ++end;
        }

        auto group = mac.substr(start, end - start);
        if (group.empty() || group.size() > 2) {
            return std::nullopt;
        }
        for (char c : group) {
            if (!isHex(c)) {
                return std::nullopt;
            }
        }

        appendGroup(out, group);
        if (++groups > kMacGroups) {
            return std::nullopt;
        }
        start = end + 1;
    }

    if (groups != kMacGroups) {
        return std::nullopt;
    }
    return out;
}

std::optional<std::string> AddressUtils::findMacInText(std::string_view text) {
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        if (!isHex(text[i]) || (i > 0 && isHex(text[i - 1]))) {
            ++i;
            continue;
        }

        std::string out;
        int groups = 0;
        size_t pos = i;

        while (true) {
            size_t start = pos;
            while (pos < n && isHex(text[pos]) && pos - start < 3) {
                ++pos;
            }
            size_t len = pos - start;
            if (len == 0 || len > 2) {
                break;
            }

            appendGroup(out, text.substr(start, len));
            if (++groups == kMacGroups) {
                return out;
            }

            if (pos < n && text[pos] == ':') {
                ++pos;
                continue;
            }
            break;
        }

        ++i;
    }

    return std::nullopt;
}

bool AddressUtils::isCanonicalMacShape(std::string_view mac) {
    if (mac.size() != 17) {
        return false;
    }
    for (size_t i = 0; i < mac.size(); ++i) {
        if (i % 3 == 2) {
            if (mac[i] != ':') {
                return false;
            }
        } else if (!isHex(mac[i])) {
            return false;
        }
    }
    return true;
}

uint32_t AddressUtils::ipToNumber(std::string_view ip) {
    uint32_t result = 0;
    uint32_t octet = 0;
    int shift = 24;

    for (char c : ip) {
        if (c == '.') {
            result |= octet << shift;
            octet = 0;
            if (shift >= 8) {
                shift -= 8;
            }
        } else if (isDigit(c)) {
            octet = octet * 10 + static_cast<uint32_t>(c - '0');
        }
    }
    result |= octet;

    return result;
}

bool AddressUtils::isBroadcastOrMulticastIp(std::string_view ip) {
    if (ip.size() >= 4 && ip.substr(ip.size() - 4) == ".255") {
        return true;
    }

    auto dot = ip.find('.');
    auto first = ip.substr(0, dot);
    if (first.empty() || first.size() > 3) {
        return false;
    }

    int value = 0;
    for (char c : first) {
        if (!isDigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    return value >= 224 && value <= 239;
}

bool AddressUtils::isBroadcastOrMulticastMac(std::string_view canonicalMac) {
    return canonicalMac == "FF:FF:FF:FF:FF:FF" || canonicalMac.substr(0, 3) == "01:";
}

std::string_view AddressUtils::trim(std::string_view value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace openfing::core
