#include "qospol/wire/policy_codec.h"
#include "qospol/policy/policy_errors.h"
#include "qospol/util/logger.h"

#include <optional>
#include <string>
#include <utility> // For std::move

namespace qospol {
namespace wire {

namespace {

constexpr int32_t PORT_RANGE_LENGTH = 2;

} // namespace

void write_policy(Parcel& parcel, const policy::QosPolicyParams& params) {
    parcel.write_int32(params.get_policy_id());
    parcel.write_int32(params.get_dscp());
    parcel.write_int32(params.get_user_priority());
    parcel.write_mac_address(params.get_source_address());
    parcel.write_mac_address(params.get_destination_address());
    parcel.write_int32(params.get_source_port());
    parcel.write_int32(params.get_protocol());

    std::optional<std::vector<int32_t>> range;
    if (params.get_destination_port_range()) {
        range = std::vector<int32_t>{params.get_destination_port_range()->start,
                                     params.get_destination_port_range()->end};
    }
    parcel.write_int32_array(range);

    parcel.write_int32(params.get_direction());
}

policy::QosPolicyParams read_policy(Parcel& parcel) {
    const size_t start = parcel.data_position();
    try {
        const int32_t policy_id = parcel.read_int32();
        const int32_t dscp = parcel.read_int32();
        const int32_t user_priority = parcel.read_int32();
        std::optional<dataplane::MacAddress> src_addr = parcel.read_mac_address();
        std::optional<dataplane::MacAddress> dst_addr = parcel.read_mac_address();
        const int32_t src_port = parcel.read_int32();
        const int32_t protocol = parcel.read_int32();

        const size_t range_offset = parcel.data_position();
        std::optional<std::vector<int32_t>> range = parcel.read_int32_array();
        std::optional<policy::PortRange> dst_port_range;
        if (range && !range->empty()) {
            if (range->size() != static_cast<size_t>(PORT_RANGE_LENGTH)) {
                throw policy::DecodeFailure("PolicyCodec: Destination port range has length " +
                                            std::to_string(range->size()) + ", expected 0 or 2.",
                                            range_offset);
            }
            dst_port_range = policy::PortRange{(*range)[0], (*range)[1]};
        }

        const int32_t direction = parcel.read_int32();

        return policy::QosPolicyParams(policy_id, dscp, user_priority,
                                       std::move(src_addr), std::move(dst_addr),
                                       src_port, protocol, std::move(dst_port_range), direction);
    } catch (const policy::DecodeFailure& e) {
        SPDLOG_LOGGER_WARN(util::Logger::instance(), "PolicyCodec: decode failed: {}", e.what());
        // Leave the parcel where the policy started so the caller can report or skip it.
        parcel.set_data_position(start);
        throw;
    }
}

void write_policy_list(Parcel& parcel, const std::vector<policy::QosPolicyParams>& policies) {
    parcel.write_int32(static_cast<int32_t>(policies.size()));
    for (const auto& p : policies) {
        write_policy(parcel, p);
    }
}

std::vector<policy::QosPolicyParams> read_policy_list(Parcel& parcel) {
    const size_t start = parcel.data_position();
    const int32_t count = parcel.read_int32();
    if (count < 0) {
        parcel.set_data_position(start);
        throw policy::DecodeFailure("PolicyCodec: Invalid policy count " + std::to_string(count) + ".",
                                    start);
    }

    std::vector<policy::QosPolicyParams> policies;
    for (int32_t i = 0; i < count; ++i) {
        try {
            policies.push_back(read_policy(parcel));
        } catch (const policy::DecodeFailure&) {
            parcel.set_data_position(start);
            throw;
        }
    }
    return policies;
}

std::vector<uint8_t> encode_policy(const policy::QosPolicyParams& params) {
    Parcel parcel;
    write_policy(parcel, params);
    return parcel.data();
}

policy::QosPolicyParams decode_policy(const std::vector<uint8_t>& bytes) {
    Parcel parcel(bytes);
    policy::QosPolicyParams params = read_policy(parcel);
    if (parcel.data_avail() != 0) {
        throw policy::DecodeFailure("PolicyCodec: " + std::to_string(parcel.data_avail()) +
                                    " trailing bytes after policy.",
                                    parcel.data_position());
    }
    return params;
}

} // namespace wire
} // namespace qospol
