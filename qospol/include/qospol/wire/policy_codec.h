#ifndef QOSPOL_WIRE_POLICY_CODEC_H_
#define QOSPOL_WIRE_POLICY_CODEC_H_

#include "qospol/policy/qos_policy_params.h"
#include "qospol/wire/parcel.h"

#include <cstdint>
#include <vector>

namespace qospol {
namespace wire {

/**
 * @brief Appends a policy to the parcel.
 *
 * Field order: policyId, dscp, userPriority, srcAddr, dstAddr, srcPort,
 * protocol, dstPortRange, direction. The translated policy ID is local state
 * and is not written.
 */
void write_policy(Parcel& parcel, const policy::QosPolicyParams& params);

/**
 * @brief Reads one policy written by write_policy().
 *
 * The result is NOT validated; it may come from an untrusted or stale peer,
 * so callers must run validate() before acting on it. The translated policy
 * ID of the result is 0.
 *
 * @throws policy::DecodeFailure on truncated or malformed input. A destination
 * port range must have length -1 or 0 (absent) or 2.
 */
policy::QosPolicyParams read_policy(Parcel& parcel);

// Count-prefixed sequence of policies.
void write_policy_list(Parcel& parcel, const std::vector<policy::QosPolicyParams>& policies);
std::vector<policy::QosPolicyParams> read_policy_list(Parcel& parcel);

// Whole-buffer helpers. decode_policy() rejects trailing bytes.
std::vector<uint8_t> encode_policy(const policy::QosPolicyParams& params);
policy::QosPolicyParams decode_policy(const std::vector<uint8_t>& bytes);

} // namespace wire
} // namespace qospol

#endif // QOSPOL_WIRE_POLICY_CODEC_H_
