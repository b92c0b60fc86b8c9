#ifndef QOSPOL_POLICY_QOS_POLICY_PARAMS_H_
#define QOSPOL_POLICY_QOS_POLICY_PARAMS_H_

#include "qospol/dataplane/mac_address.h"
#include "qospol/policy/policy_errors.h"   // For PolicyViolation
#include "qospol/policy/policy_types.h"

#include <cstddef>
#include <cstdint>
#include <functional> // For std::hash
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace qospol {

namespace wire {
class Parcel;
}
namespace policy {
class QosPolicyParams;
}
namespace wire {
policy::QosPolicyParams read_policy(Parcel& parcel);
}

namespace policy {

// Inclusive destination port range. No start <= end ordering is required.
struct PortRange {
    int32_t start;
    int32_t end;

    bool operator==(const PortRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const PortRange& other) const { return !(*this == other); }
};

/**
 * @brief A QoS classification policy: which packets to mark with a DSCP value
 * (uplink) or assign a user priority (downlink).
 *
 * Instances are produced by QosPolicyParams::Builder, which rejects invalid
 * field combinations, or by the wire decoder, which does not validate. Every
 * field except the translated policy ID is fixed at construction.
 */
class QosPolicyParams {
public:
    class Builder;

    policy::PolicyId get_policy_id() const { return policy_id_; }

    // Identifier assigned by the receiving system after acceptance, 0 until then.
    int32_t get_translated_policy_id() const { return translated_policy_id_; }

    // DSCP value, or DSCP_ANY.
    int32_t get_dscp() const { return dscp_; }

    // User priority, or USER_PRIORITY_ANY.
    UserPriority get_user_priority() const { return user_priority_; }

    const std::optional<dataplane::MacAddress>& get_source_address() const { return src_addr_; }
    const std::optional<dataplane::MacAddress>& get_destination_address() const { return dst_addr_; }

    // Source port, or SOURCE_PORT_ANY.
    int32_t get_source_port() const { return src_port_; }

    Protocol get_protocol() const { return protocol_; }

    const std::optional<PortRange>& get_destination_port_range() const { return dst_port_range_; }

    Direction get_direction() const { return direction_; }

    /**
     * @brief Sets the translated policy ID.
     *
     * Reserved for the system that accepted the policy. This is the only
     * mutation an instance supports and it is not synchronised: if the object
     * is shared across threads, the writer and all readers of the translated
     * ID must coordinate externally.
     */
    void set_translated_policy_id(int32_t translated_policy_id) {
        translated_policy_id_ = translated_policy_id;
    }

    /**
     * @brief Evaluates every policy rule against the current field values.
     * @return All violated rules in rule order; empty if the policy is valid.
     */
    std::vector<PolicyViolation> collect_violations() const;

    /**
     * @brief Checks the policy rules, logging each violation at error level.
     * @return true if all parameters are valid, false otherwise.
     */
    bool validate() const;

    // Deterministic single-line dump of all wire fields, for logs only.
    std::string to_string() const;

    // Field-wise comparison of the wire fields. The translated ID is local
    // bookkeeping and takes no part in equality or hashing.
    bool operator==(const QosPolicyParams& other) const;
    bool operator!=(const QosPolicyParams& other) const { return !(*this == other); }

private:
    // The wire decoder rebuilds instances without validating them.
    friend QosPolicyParams wire::read_policy(wire::Parcel& parcel);

    QosPolicyParams(policy::PolicyId policy_id, int32_t dscp, UserPriority user_priority,
                    std::optional<dataplane::MacAddress> src_addr,
                    std::optional<dataplane::MacAddress> dst_addr,
                    int32_t src_port, Protocol protocol,
                    std::optional<PortRange> dst_port_range, Direction direction);

    policy::PolicyId policy_id_;
    int32_t translated_policy_id_ = 0;
    int32_t dscp_;
    UserPriority user_priority_;
    std::optional<dataplane::MacAddress> src_addr_;
    std::optional<dataplane::MacAddress> dst_addr_;
    int32_t src_port_;
    Protocol protocol_;
    std::optional<PortRange> dst_port_range_;
    Direction direction_;
};

/**
 * @brief Staging object for QosPolicyParams.
 *
 * Setters never validate; build() does. A builder can be reused: each build()
 * returns an independent snapshot of the currently staged fields.
 */
class QosPolicyParams::Builder {
public:
    /**
     * @param policy_id ID in [1, 255], unique among the requester's policies.
     *                  A policy sent with an ID already in use is rejected by
     *                  the receiver; remove the old one before resending.
     * @param direction DIRECTION_UPLINK or DIRECTION_DOWNLINK.
     */
    Builder(policy::PolicyId policy_id, Direction direction);

    /**
     * @brief Matches packets with this source address.
     * @throws ArgumentError if value is std::nullopt.
     */
    Builder& set_source_address(const std::optional<dataplane::MacAddress>& value);

    /**
     * @brief Matches packets with this destination address.
     * @throws ArgumentError if value is std::nullopt.
     */
    Builder& set_destination_address(const std::optional<dataplane::MacAddress>& value);

    // Uplink: DSCP applied to matching packets. Downlink: part of the classifier.
    Builder& set_dscp(int32_t value);

    // Priority applied to matching packets. Only meaningful for downlink.
    Builder& set_user_priority(UserPriority value);

    Builder& set_source_port(int32_t value);
    Builder& set_protocol(Protocol value);
    Builder& set_destination_port_range(int32_t start, int32_t end);

    /**
     * @brief Constructs a policy from the staged fields.
     * @throws ValidationFailure listing every violated rule.
     */
    QosPolicyParams build() const;

private:
    policy::PolicyId policy_id_;
    Direction direction_;
    std::optional<dataplane::MacAddress> src_addr_;
    std::optional<dataplane::MacAddress> dst_addr_;
    int32_t dscp_ = DSCP_ANY;
    UserPriority user_priority_ = USER_PRIORITY_ANY;
    int32_t src_port_ = SOURCE_PORT_ANY;
    Protocol protocol_ = PROTOCOL_ANY;
    std::optional<PortRange> dst_port_range_;
};

std::ostream& operator<<(std::ostream& os, const QosPolicyParams& params);

} // namespace policy
} // namespace qospol

namespace std {
template <>
struct hash<qospol::policy::QosPolicyParams> {
    size_t operator()(const qospol::policy::QosPolicyParams& params) const;
};
} // namespace std

#endif // QOSPOL_POLICY_QOS_POLICY_PARAMS_H_
