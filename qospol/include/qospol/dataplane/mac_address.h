#ifndef QOSPOL_DATAPLANE_MAC_ADDRESS_H_
#define QOSPOL_DATAPLANE_MAC_ADDRESS_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional> // For std::hash
#include <ostream>
#include <string>

namespace qospol {
namespace dataplane {

// 48-bit IEEE 802 hardware address used as a source/destination classifier.
// Parse errors are reported with policy::ArgumentError (policy_errors.h), the
// project-wide error header; that header has no dependencies of its own.
class MacAddress {
public:
    static constexpr size_t LENGTH = 6;
    using Bytes = std::array<uint8_t, LENGTH>;

    // All-zero address.
    MacAddress() : bytes_{} {}

    explicit MacAddress(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Parses the canonical "aa:bb:cc:dd:ee:ff" form (hex digits are
     * case-insensitive, '-' is accepted as a separator too).
     * @throws policy::ArgumentError if the text is not exactly six hex octets.
     */
    static MacAddress from_string(const std::string& text);

    const Bytes& bytes() const { return bytes_; }

    // Lowercase, colon separated.
    std::string to_string() const;

    bool operator==(const MacAddress& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const MacAddress& other) const { return bytes_ != other.bytes_; }
    bool operator<(const MacAddress& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const MacAddress& address);

} // namespace dataplane
} // namespace qospol

namespace std {
template <>
struct hash<qospol::dataplane::MacAddress> {
    size_t operator()(const qospol::dataplane::MacAddress& address) const;
};
} // namespace std

#endif // QOSPOL_DATAPLANE_MAC_ADDRESS_H_
