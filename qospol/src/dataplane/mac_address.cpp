#include "qospol/dataplane/mac_address.h"
#include "qospol/policy/policy_errors.h"

#include <boost/container_hash/hash.hpp>

#include <cctype>
#include <cstdio>

namespace qospol {
namespace dataplane {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

MacAddress MacAddress::from_string(const std::string& text) {
    // "xx:xx:xx:xx:xx:xx" is 17 characters.
    if (text.size() != LENGTH * 3 - 1) {
        throw policy::ArgumentError("MacAddress: Invalid address length in \"" + text + "\".");
    }

    Bytes bytes{};
    for (size_t i = 0; i < LENGTH; ++i) {
        const size_t pos = i * 3;
        if (i > 0 && text[pos - 1] != ':' && text[pos - 1] != '-') {
            throw policy::ArgumentError("MacAddress: Expected separator at offset " +
                                        std::to_string(pos - 1) + " in \"" + text + "\".");
        }
        int high = hex_value(text[pos]);
        int low = hex_value(text[pos + 1]);
        if (high < 0 || low < 0) {
            throw policy::ArgumentError("MacAddress: Invalid hex octet at offset " +
                                        std::to_string(pos) + " in \"" + text + "\".");
        }
        bytes[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return MacAddress(bytes);
}

std::string MacAddress::to_string() const {
    char buf[LENGTH * 3];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
    return std::string(buf);
}

std::ostream& operator<<(std::ostream& os, const MacAddress& address) {
    return os << address.to_string();
}

} // namespace dataplane
} // namespace qospol

namespace std {

size_t hash<qospol::dataplane::MacAddress>::operator()(const qospol::dataplane::MacAddress& address) const {
    const auto& bytes = address.bytes();
    return boost::hash_range(bytes.begin(), bytes.end());
}

} // namespace std
