#include "qospol/wire/parcel.h"
#include "qospol/policy/policy_errors.h"

#include <boost/endian/conversion.hpp>

#include <string>
#include <utility> // For std::move

namespace qospol {
namespace wire {

namespace {

constexpr size_t INT32_SIZE = sizeof(int32_t);
constexpr int32_t NULL_ARRAY_LENGTH = -1;
constexpr int32_t ADDRESS_ABSENT = 0;
constexpr int32_t ADDRESS_PRESENT = 1;

} // namespace

Parcel::Parcel(std::vector<uint8_t> data) : data_(std::move(data)), position_(0) {}

void Parcel::require(size_t bytes, const char* what) const {
    if (data_avail() < bytes) {
        throw policy::DecodeFailure(std::string("Parcel: Truncated data reading ") + what +
                                    ": need " + std::to_string(bytes) + " bytes at offset " +
                                    std::to_string(position_) + ", have " +
                                    std::to_string(data_avail()) + ".",
                                    position_);
    }
}

void Parcel::set_data_position(size_t position) {
    if (position > data_.size()) {
        throw policy::DecodeFailure("Parcel: Position " + std::to_string(position) +
                                    " is past the end of " + std::to_string(data_.size()) + " bytes.",
                                    position_);
    }
    position_ = position;
}

void Parcel::write_int32(int32_t value) {
    const size_t offset = data_.size();
    data_.resize(offset + INT32_SIZE);
    boost::endian::store_little_s32(data_.data() + offset, value);
}

void Parcel::write_int32_array(const std::optional<std::vector<int32_t>>& values) {
    if (!values) {
        write_int32(NULL_ARRAY_LENGTH);
        return;
    }
    write_int32(static_cast<int32_t>(values->size()));
    for (int32_t v : *values) {
        write_int32(v);
    }
}

void Parcel::write_mac_address(const std::optional<dataplane::MacAddress>& address) {
    if (!address) {
        write_int32(ADDRESS_ABSENT);
        return;
    }
    write_int32(ADDRESS_PRESENT);
    const auto& bytes = address->bytes();
    data_.insert(data_.end(), bytes.begin(), bytes.end());
}

int32_t Parcel::read_int32() {
    require(INT32_SIZE, "int32");
    int32_t value = boost::endian::load_little_s32(data_.data() + position_);
    position_ += INT32_SIZE;
    return value;
}

std::optional<std::vector<int32_t>> Parcel::read_int32_array() {
    const size_t start = position_;
    const int32_t length = read_int32();
    if (length == NULL_ARRAY_LENGTH) {
        return std::nullopt;
    }
    if (length < 0) {
        position_ = start;
        throw policy::DecodeFailure("Parcel: Invalid array length " + std::to_string(length) +
                                    " at offset " + std::to_string(start) + ".",
                                    start);
    }
    // Check the whole payload up front so a hostile length cannot force a huge allocation.
    if (data_avail() / INT32_SIZE < static_cast<size_t>(length)) {
        position_ = start;
        throw policy::DecodeFailure("Parcel: Array length " + std::to_string(length) +
                                    " at offset " + std::to_string(start) +
                                    " exceeds the remaining data.",
                                    start);
    }

    std::vector<int32_t> values;
    values.reserve(static_cast<size_t>(length));
    for (int32_t i = 0; i < length; ++i) {
        values.push_back(read_int32());
    }
    return values;
}

std::optional<dataplane::MacAddress> Parcel::read_mac_address() {
    const size_t start = position_;
    const int32_t flag = read_int32();
    if (flag == ADDRESS_ABSENT) {
        return std::nullopt;
    }
    if (flag != ADDRESS_PRESENT) {
        position_ = start;
        throw policy::DecodeFailure("Parcel: Invalid address presence flag " + std::to_string(flag) +
                                    " at offset " + std::to_string(start) + ".",
                                    start);
    }
    if (data_avail() < dataplane::MacAddress::LENGTH) {
        const size_t have = data_avail();
        position_ = start;
        throw policy::DecodeFailure("Parcel: Truncated MAC address at offset " + std::to_string(start) +
                                    ": need " + std::to_string(dataplane::MacAddress::LENGTH) +
                                    " address bytes, have " + std::to_string(have) + ".",
                                    start);
    }

    dataplane::MacAddress::Bytes bytes{};
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = data_[position_ + i];
    }
    position_ += bytes.size();
    return dataplane::MacAddress(bytes);
}

} // namespace wire
} // namespace qospol
