#include "gtest/gtest.h"
#include "qospol/wire/parcel.h"
#include "qospol/policy/policy_errors.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace qospol {
namespace wire {

class ParcelTest : public ::testing::Test {
protected:
    Parcel parcel_;
};

TEST_F(ParcelTest, Int32IsLittleEndian) {
    parcel_.write_int32(0x01020304);
    parcel_.write_int32(-2);
    std::vector<uint8_t> expected{0x04, 0x03, 0x02, 0x01, 0xfe, 0xff, 0xff, 0xff};
    EXPECT_EQ(parcel_.data(), expected);

    EXPECT_EQ(parcel_.read_int32(), 0x01020304);
    EXPECT_EQ(parcel_.read_int32(), -2);
    EXPECT_EQ(parcel_.data_avail(), 0u);
}

TEST_F(ParcelTest, Int32Extremes) {
    parcel_.write_int32(std::numeric_limits<int32_t>::min());
    parcel_.write_int32(std::numeric_limits<int32_t>::max());
    EXPECT_EQ(parcel_.read_int32(), std::numeric_limits<int32_t>::min());
    EXPECT_EQ(parcel_.read_int32(), std::numeric_limits<int32_t>::max());
}

TEST_F(ParcelTest, ReadPastEndThrowsAndKeepsPosition) {
    parcel_.write_int32(7);
    EXPECT_EQ(parcel_.read_int32(), 7);
    try {
        parcel_.read_int32();
        FAIL() << "Expected DecodeFailure";
    } catch (const policy::DecodeFailure& e) {
        EXPECT_EQ(e.offset(), 4u);
    }
    EXPECT_EQ(parcel_.data_position(), 4u);
}

TEST_F(ParcelTest, PartialInt32IsTruncation) {
    Parcel p(std::vector<uint8_t>{0x01, 0x02, 0x03});
    EXPECT_THROW(p.read_int32(), policy::DecodeFailure);
}

TEST_F(ParcelTest, ArrayLayout) {
    parcel_.write_int32_array(std::vector<int32_t>{10, 20});
    parcel_.write_int32_array(std::nullopt);
    parcel_.write_int32_array(std::vector<int32_t>{});
    EXPECT_EQ(parcel_.data_size(), 4u + 8u + 4u + 4u);

    auto first = parcel_.read_int32_array();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, (std::vector<int32_t>{10, 20}));
    EXPECT_FALSE(parcel_.read_int32_array().has_value());
    auto empty = parcel_.read_int32_array();
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(ParcelTest, NullArrayIsMinusOneLength) {
    parcel_.write_int32_array(std::nullopt);
    EXPECT_EQ(parcel_.read_int32(), -1);
}

TEST_F(ParcelTest, NegativeArrayLengthRejected) {
    parcel_.write_int32(-5);
    EXPECT_THROW(parcel_.read_int32_array(), policy::DecodeFailure);
    EXPECT_EQ(parcel_.data_position(), 0u);
}

TEST_F(ParcelTest, OversizedArrayLengthRejected) {
    parcel_.write_int32(std::numeric_limits<int32_t>::max());
    parcel_.write_int32(1);
    EXPECT_THROW(parcel_.read_int32_array(), policy::DecodeFailure);
    EXPECT_EQ(parcel_.data_position(), 0u);
}

TEST_F(ParcelTest, MacAddressLayout) {
    dataplane::MacAddress mac = dataplane::MacAddress::from_string("de:ad:be:ef:00:01");
    parcel_.write_mac_address(mac);
    parcel_.write_mac_address(std::nullopt);

    std::vector<uint8_t> expected{0x01, 0x00, 0x00, 0x00, 0xde, 0xad, 0xbe, 0xef, 0x00, 0x01,
                                  0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(parcel_.data(), expected);

    auto read = parcel_.read_mac_address();
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, mac);
    EXPECT_FALSE(parcel_.read_mac_address().has_value());
}

TEST_F(ParcelTest, BadPresenceFlagRejected) {
    parcel_.write_int32(2);
    EXPECT_THROW(parcel_.read_mac_address(), policy::DecodeFailure);
    EXPECT_EQ(parcel_.data_position(), 0u);
}

TEST_F(ParcelTest, TruncatedMacAddressRejected) {
    Parcel p(std::vector<uint8_t>{0x01, 0x00, 0x00, 0x00, 0xaa, 0xbb, 0xcc});
    try {
        p.read_mac_address();
        FAIL() << "Expected DecodeFailure";
    } catch (const policy::DecodeFailure& e) {
        EXPECT_EQ(e.offset(), 0u);
        const std::string what = e.what();
        EXPECT_NE(what.find("MAC address"), std::string::npos);
        EXPECT_NE(what.find("have 3"), std::string::npos);
    }
    EXPECT_EQ(p.data_position(), 0u);
}

TEST_F(ParcelTest, SetDataPosition) {
    parcel_.write_int32(1);
    parcel_.write_int32(2);
    parcel_.set_data_position(4);
    EXPECT_EQ(parcel_.read_int32(), 2);
    parcel_.set_data_position(0);
    EXPECT_EQ(parcel_.read_int32(), 1);
    EXPECT_THROW(parcel_.set_data_position(9), policy::DecodeFailure);
}

} // namespace wire
} // namespace qospol
