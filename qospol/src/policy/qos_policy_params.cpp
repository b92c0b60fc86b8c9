#include "qospol/policy/qos_policy_params.h"
#include "qospol/util/logger.h"

#include <boost/container_hash/hash.hpp>

#include <sstream>
#include <utility> // For std::move

namespace qospol {
namespace policy {

namespace {

void log_violations(const std::vector<PolicyViolation>& violations) {
    for (const auto& v : violations) {
        SPDLOG_LOGGER_ERROR(util::Logger::instance(), "QosPolicyParams: {} ({})",
                            v.message, rule_to_string(v.rule));
    }
}

} // namespace

QosPolicyParams::QosPolicyParams(policy::PolicyId policy_id, int32_t dscp, UserPriority user_priority,
                                 std::optional<dataplane::MacAddress> src_addr,
                                 std::optional<dataplane::MacAddress> dst_addr,
                                 int32_t src_port, Protocol protocol,
                                 std::optional<PortRange> dst_port_range, Direction direction)
    : policy_id_(policy_id),
      // translated_policy_id_ stays 0 until the receiving system assigns one
      dscp_(dscp),
      user_priority_(user_priority),
      src_addr_(std::move(src_addr)),
      dst_addr_(std::move(dst_addr)),
      src_port_(src_port),
      protocol_(protocol),
      dst_port_range_(std::move(dst_port_range)),
      direction_(direction) {}

std::vector<PolicyViolation> QosPolicyParams::collect_violations() const {
    std::vector<PolicyViolation> violations;

    if (policy_id_ < MIN_POLICY_ID || policy_id_ > MAX_POLICY_ID) {
        violations.push_back({PolicyRule::POLICY_ID_RANGE, "policyId", policy_id_,
                              "Policy ID not in valid range: " + std::to_string(policy_id_)});
    }
    if (dscp_ < DSCP_ANY || dscp_ > MAX_DSCP) {
        violations.push_back({PolicyRule::DSCP_RANGE, "dscp", dscp_,
                              "DSCP value not in valid range: " + std::to_string(dscp_)});
    }
    if (user_priority_ < USER_PRIORITY_ANY || user_priority_ > USER_PRIORITY_VOICE_HIGH) {
        violations.push_back({PolicyRule::USER_PRIORITY_RANGE, "userPriority", user_priority_,
                              "User priority not in valid range: " + std::to_string(user_priority_)});
    }
    if (src_port_ < SOURCE_PORT_ANY || src_port_ > MAX_PORT) {
        violations.push_back({PolicyRule::SOURCE_PORT_RANGE, "srcPort", src_port_,
                              "Source port not in valid range: " + std::to_string(src_port_)});
    }
    if (dst_port_range_) {
        const auto in_range = [](int32_t port) { return port >= 0 && port <= MAX_PORT; };
        const PortRange& range = *dst_port_range_;
        if (!in_range(range.start) || !in_range(range.end)) {
            violations.push_back({PolicyRule::DESTINATION_PORT_RANGE, "dstPortRange",
                                  in_range(range.start) ? range.end : range.start,
                                  "Dst port range value not valid. start=" + std::to_string(range.start) +
                                  ", end=" + std::to_string(range.end)});
        }
    }
    if (direction_ != DIRECTION_UPLINK && direction_ != DIRECTION_DOWNLINK) {
        violations.push_back({PolicyRule::DIRECTION_VALUE, "direction", direction_,
                              "Invalid direction enum: " + std::to_string(direction_)});
    }

    // DSCP and user priority requirements depend on direction
    if (direction_ == DIRECTION_UPLINK && dscp_ == DSCP_ANY) {
        violations.push_back({PolicyRule::UPLINK_REQUIRES_DSCP, "dscp", dscp_,
                              "DSCP must be provided for uplink requests"});
    }
    if (direction_ == DIRECTION_DOWNLINK && user_priority_ == USER_PRIORITY_ANY) {
        violations.push_back({PolicyRule::DOWNLINK_REQUIRES_USER_PRIORITY, "userPriority", user_priority_,
                              "User priority must be provided for downlink requests"});
    }

    return violations;
}

bool QosPolicyParams::validate() const {
    const std::vector<PolicyViolation> violations = collect_violations();
    log_violations(violations);
    return violations.empty();
}

std::string QosPolicyParams::to_string() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

bool QosPolicyParams::operator==(const QosPolicyParams& other) const {
    // std::optional comparison: both empty is equal, one empty is unequal,
    // contained values are only compared when both are engaged.
    return policy_id_ == other.policy_id_ &&
           dscp_ == other.dscp_ &&
           user_priority_ == other.user_priority_ &&
           src_addr_ == other.src_addr_ &&
           dst_addr_ == other.dst_addr_ &&
           src_port_ == other.src_port_ &&
           protocol_ == other.protocol_ &&
           dst_port_range_ == other.dst_port_range_ &&
           direction_ == other.direction_;
}

std::ostream& operator<<(std::ostream& os, const QosPolicyParams& params) {
    os << "{policyId=" << params.get_policy_id() << ", "
       << "dscp=" << params.get_dscp() << ", "
       << "userPriority=" << params.get_user_priority() << ", "
       << "srcAddr=";
    if (params.get_source_address()) {
        os << *params.get_source_address();
    } else {
        os << "null";
    }
    os << ", dstAddr=";
    if (params.get_destination_address()) {
        os << *params.get_destination_address();
    } else {
        os << "null";
    }
    os << ", srcPort=" << params.get_source_port() << ", "
       << "protocol=" << params.get_protocol() << ", "
       << "dstPortRange=";
    if (params.get_destination_port_range()) {
        const PortRange& range = *params.get_destination_port_range();
        os << "[" << range.start << ", " << range.end << "]";
    } else {
        os << "null";
    }
    os << ", direction=" << params.get_direction() << "}";
    return os;
}

// --- Builder ---

QosPolicyParams::Builder::Builder(policy::PolicyId policy_id, Direction direction)
    : policy_id_(policy_id), direction_(direction) {
    // Range checks are deferred to build()
}

QosPolicyParams::Builder& QosPolicyParams::Builder::set_source_address(
    const std::optional<dataplane::MacAddress>& value) {
    if (!value) {
        throw ArgumentError("QosPolicyParams::Builder: Source address cannot be null");
    }
    src_addr_ = value;
    return *this;
}

QosPolicyParams::Builder& QosPolicyParams::Builder::set_destination_address(
    const std::optional<dataplane::MacAddress>& value) {
    if (!value) {
        throw ArgumentError("QosPolicyParams::Builder: Destination address cannot be null");
    }
    dst_addr_ = value;
    return *this;
}

QosPolicyParams::Builder& QosPolicyParams::Builder::set_dscp(int32_t value) {
    dscp_ = value;
    return *this;
}

QosPolicyParams::Builder& QosPolicyParams::Builder::set_user_priority(UserPriority value) {
    user_priority_ = value;
    return *this;
}

QosPolicyParams::Builder& QosPolicyParams::Builder::set_source_port(int32_t value) {
    src_port_ = value;
    return *this;
}

QosPolicyParams::Builder& QosPolicyParams::Builder::set_protocol(Protocol value) {
    protocol_ = value;
    return *this;
}

QosPolicyParams::Builder& QosPolicyParams::Builder::set_destination_port_range(int32_t start, int32_t end) {
    dst_port_range_ = PortRange{start, end};
    return *this;
}

QosPolicyParams QosPolicyParams::Builder::build() const {
    QosPolicyParams params(policy_id_, dscp_, user_priority_, src_addr_, dst_addr_,
                           src_port_, protocol_, dst_port_range_, direction_);
    std::vector<PolicyViolation> violations = params.collect_violations();
    if (!violations.empty()) {
        log_violations(violations);
        throw ValidationFailure(std::move(violations));
    }
    SPDLOG_LOGGER_DEBUG(util::Logger::instance(), "QosPolicyParams: built {}", params.to_string());
    return params;
}

} // namespace policy
} // namespace qospol

namespace std {

size_t hash<qospol::policy::QosPolicyParams>::operator()(const qospol::policy::QosPolicyParams& p) const {
    size_t seed = 0;
    boost::hash_combine(seed, p.get_policy_id());
    boost::hash_combine(seed, p.get_dscp());
    boost::hash_combine(seed, p.get_user_priority());
    // Absent optionals contribute a fixed marker so that "absent" and "present" differ.
    boost::hash_combine(seed, p.get_source_address().has_value());
    if (p.get_source_address()) {
        boost::hash_combine(seed, std::hash<qospol::dataplane::MacAddress>{}(*p.get_source_address()));
    }
    boost::hash_combine(seed, p.get_destination_address().has_value());
    if (p.get_destination_address()) {
        boost::hash_combine(seed, std::hash<qospol::dataplane::MacAddress>{}(*p.get_destination_address()));
    }
    boost::hash_combine(seed, p.get_source_port());
    boost::hash_combine(seed, p.get_protocol());
    boost::hash_combine(seed, p.get_destination_port_range().has_value());
    if (p.get_destination_port_range()) {
        boost::hash_combine(seed, p.get_destination_port_range()->start);
        boost::hash_combine(seed, p.get_destination_port_range()->end);
    }
    boost::hash_combine(seed, p.get_direction());
    return seed;
}

} // namespace std
