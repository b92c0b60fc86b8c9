#include "qospol/policy/policy_errors.h"

#include <utility> // For std::move

namespace qospol {
namespace policy {

std::string rule_to_string(PolicyRule rule) {
    switch (rule) {
        case PolicyRule::POLICY_ID_RANGE:                 return "POLICY_ID_RANGE";
        case PolicyRule::DSCP_RANGE:                      return "DSCP_RANGE";
        case PolicyRule::USER_PRIORITY_RANGE:             return "USER_PRIORITY_RANGE";
        case PolicyRule::SOURCE_PORT_RANGE:               return "SOURCE_PORT_RANGE";
        case PolicyRule::DESTINATION_PORT_RANGE:          return "DESTINATION_PORT_RANGE";
        case PolicyRule::DIRECTION_VALUE:                 return "DIRECTION_VALUE";
        case PolicyRule::UPLINK_REQUIRES_DSCP:            return "UPLINK_REQUIRES_DSCP";
        case PolicyRule::DOWNLINK_REQUIRES_USER_PRIORITY: return "DOWNLINK_REQUIRES_USER_PRIORITY";
    }
    return "UNKNOWN_RULE";
}

ValidationFailure::ValidationFailure(std::vector<PolicyViolation> violations)
    : std::invalid_argument(describe(violations)),
      violations_(std::move(violations)) {}

std::string ValidationFailure::describe(const std::vector<PolicyViolation>& violations) {
    std::string text = "QosPolicyParams: Provided parameters are invalid";
    for (size_t i = 0; i < violations.size(); ++i) {
        text += (i == 0) ? ": " : "; ";
        text += violations[i].message;
    }
    return text;
}

} // namespace policy
} // namespace qospol
