#include "qospol/policy/policy_types.h"

#include <string>

namespace qospol {
namespace policy {

namespace {

std::string unknown(int32_t value) {
    return "UNKNOWN(" + std::to_string(value) + ")";
}

} // namespace

std::string direction_to_string(Direction direction) {
    switch (direction) {
        case DIRECTION_UPLINK:   return "UPLINK";
        case DIRECTION_DOWNLINK: return "DOWNLINK";
        default:                 return unknown(direction);
    }
}

std::string protocol_to_string(Protocol protocol) {
    switch (protocol) {
        case PROTOCOL_ANY: return "ANY";
        case PROTOCOL_TCP: return "TCP";
        case PROTOCOL_UDP: return "UDP";
        case PROTOCOL_ESP: return "ESP";
        default:           return unknown(protocol);
    }
}

std::string user_priority_to_string(UserPriority priority) {
    switch (priority) {
        case USER_PRIORITY_ANY:              return "ANY";
        case USER_PRIORITY_BEST_EFFORT_LOW:  return "BEST_EFFORT_LOW";
        case USER_PRIORITY_BACKGROUND_LOW:   return "BACKGROUND_LOW";
        case USER_PRIORITY_BACKGROUND_HIGH:  return "BACKGROUND_HIGH";
        case USER_PRIORITY_BEST_EFFORT_HIGH: return "BEST_EFFORT_HIGH";
        case USER_PRIORITY_VIDEO_LOW:        return "VIDEO_LOW";
        case USER_PRIORITY_VIDEO_HIGH:       return "VIDEO_HIGH";
        case USER_PRIORITY_VOICE_LOW:        return "VOICE_LOW";
        case USER_PRIORITY_VOICE_HIGH:       return "VOICE_HIGH";
        default:                             return unknown(priority);
    }
}

} // namespace policy
} // namespace qospol
