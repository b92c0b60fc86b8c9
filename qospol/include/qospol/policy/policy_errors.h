#ifndef QOSPOL_POLICY_POLICY_ERRORS_H_
#define QOSPOL_POLICY_POLICY_ERRORS_H_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace qospol {
namespace policy {

// Cross-field rules checked by QosPolicyParams. Declared in evaluation order.
enum class PolicyRule {
    POLICY_ID_RANGE,          // 1 <= policy_id <= 255
    DSCP_RANGE,               // dscp == -1 or 0..63
    USER_PRIORITY_RANGE,      // -1..7
    SOURCE_PORT_RANGE,        // -1..65535
    DESTINATION_PORT_RANGE,   // both endpoints 0..65535 when present
    DIRECTION_VALUE,          // UPLINK or DOWNLINK
    UPLINK_REQUIRES_DSCP,
    DOWNLINK_REQUIRES_USER_PRIORITY
};

std::string rule_to_string(PolicyRule rule);

struct PolicyViolation {
    PolicyRule rule;
    std::string field;      // Name of the offending field, e.g. "dscp"
    int64_t value;          // Offending value (first bad endpoint for the port range)
    std::string message;

    bool operator==(const PolicyViolation& other) const {
        return rule == other.rule && field == other.field &&
               value == other.value && message == other.message;
    }
};

/**
 * @brief Raised when a setter that requires a present value is given an absent one,
 * or when textual input (e.g. a MAC address string) cannot be parsed.
 */
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& what_arg)
        : std::invalid_argument(what_arg) {}
};

/**
 * @brief Raised by QosPolicyParams::Builder::build() when the staged fields
 * break one or more policy rules. All violated rules are reported, in rule order.
 */
class ValidationFailure : public std::invalid_argument {
public:
    explicit ValidationFailure(std::vector<PolicyViolation> violations);

    const std::vector<PolicyViolation>& violations() const { return violations_; }

private:
    static std::string describe(const std::vector<PolicyViolation>& violations);

    std::vector<PolicyViolation> violations_;
};

/**
 * @brief Raised when a wire payload is truncated, carries an illegal length
 * or flag, or has trailing data. Distinct from ValidationFailure: a payload can
 * decode cleanly and still describe an invalid policy.
 */
class DecodeFailure : public std::runtime_error {
public:
    DecodeFailure(const std::string& what_arg, size_t offset)
        : std::runtime_error(what_arg), offset_(offset) {}

    // Read position in the payload at which decoding gave up.
    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

} // namespace policy
} // namespace qospol

#endif // QOSPOL_POLICY_POLICY_ERRORS_H_
