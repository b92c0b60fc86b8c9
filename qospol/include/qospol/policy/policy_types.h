#ifndef QOSPOL_POLICY_POLICY_TYPES_H_
#define QOSPOL_POLICY_POLICY_TYPES_H_

#include <cstdint>
#include <string>

namespace qospol {
namespace policy {

// Caller-assigned policy identifier. Uniqueness is the requester's concern.
using PolicyId = int32_t;

constexpr PolicyId MIN_POLICY_ID = 1;
constexpr PolicyId MAX_POLICY_ID = 255;

// DSCP marking (6 bits). DSCP_ANY means the policy does not specify one.
constexpr int32_t DSCP_ANY = -1;
constexpr int32_t MAX_DSCP = 63;

constexpr int32_t SOURCE_PORT_ANY = -1;
constexpr int32_t MAX_PORT = 65535;

// IP protocol numbers. Kept as plain integers: a builder may stage any value
// and a decoded policy may carry anything, validation decides what is usable.
using Protocol = int32_t;

constexpr Protocol PROTOCOL_ANY = -1;
constexpr Protocol PROTOCOL_TCP = 6;
constexpr Protocol PROTOCOL_UDP = 17;
constexpr Protocol PROTOCOL_ESP = 50;

using Direction = int32_t;

constexpr Direction DIRECTION_UPLINK = 0;
constexpr Direction DIRECTION_DOWNLINK = 1;

// 802.1D user priority. Note the numeric order is not the "importance" order:
// best-effort-low is 0, background sits at 1 and 2.
using UserPriority = int32_t;

constexpr UserPriority USER_PRIORITY_ANY = -1;
constexpr UserPriority USER_PRIORITY_BEST_EFFORT_LOW = 0;
constexpr UserPriority USER_PRIORITY_BACKGROUND_LOW = 1;
constexpr UserPriority USER_PRIORITY_BACKGROUND_HIGH = 2;
constexpr UserPriority USER_PRIORITY_BEST_EFFORT_HIGH = 3;
constexpr UserPriority USER_PRIORITY_VIDEO_LOW = 4;
constexpr UserPriority USER_PRIORITY_VIDEO_HIGH = 5;
constexpr UserPriority USER_PRIORITY_VOICE_LOW = 6;
constexpr UserPriority USER_PRIORITY_VOICE_HIGH = 7;

// Human-readable names for log output. Unknown values render as "UNKNOWN(<n>)".
std::string direction_to_string(Direction direction);
std::string protocol_to_string(Protocol protocol);
std::string user_priority_to_string(UserPriority priority);

} // namespace policy
} // namespace qospol

#endif // QOSPOL_POLICY_POLICY_TYPES_H_
