#ifndef QOSPOL_WIRE_PARCEL_H_
#define QOSPOL_WIRE_PARCEL_H_

#include "qospol/dataplane/mac_address.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace qospol {
namespace wire {

/**
 * @brief Sequential byte container used to move policies across a process boundary.
 *
 * Writes append to the end of the buffer; reads consume from a cursor that
 * starts at offset 0. Integers are 32-bit two's complement, little-endian on
 * every host. Any read that cannot be satisfied throws policy::DecodeFailure
 * and leaves the cursor where it was.
 *
 * Layouts:
 *   int32        4 bytes
 *   int32 array  int32 length (-1 for absent), then length int32 elements
 *   MAC address  int32 presence flag (0 or 1), then 6 raw bytes if present
 */
class Parcel {
public:
    Parcel() = default;
    explicit Parcel(std::vector<uint8_t> data);

    void write_int32(int32_t value);
    void write_int32_array(const std::optional<std::vector<int32_t>>& values);
    void write_mac_address(const std::optional<dataplane::MacAddress>& address);

    int32_t read_int32();
    std::optional<std::vector<int32_t>> read_int32_array();
    std::optional<dataplane::MacAddress> read_mac_address();

    const std::vector<uint8_t>& data() const { return data_; }
    size_t data_size() const { return data_.size(); }
    size_t data_position() const { return position_; }
    // Bytes left to read.
    size_t data_avail() const { return data_.size() - position_; }

    // Moves the read cursor. Throws policy::DecodeFailure if past the end.
    void set_data_position(size_t position);

private:
    // Throws unless `bytes` more bytes can be read.
    void require(size_t bytes, const char* what) const;

    std::vector<uint8_t> data_;
    size_t position_ = 0;
};

} // namespace wire
} // namespace qospol

#endif // QOSPOL_WIRE_PARCEL_H_
