#include "gtest/gtest.h"
#include "qospol/policy/policy_types.h"
#include "qospol/policy/policy_errors.h"

namespace qospol {
namespace policy {

TEST(PolicyTypesTest, WireValuesAreStable) {
    // These numbers travel on the wire and must never change.
    EXPECT_EQ(PROTOCOL_ANY, -1);
    EXPECT_EQ(PROTOCOL_TCP, 6);
    EXPECT_EQ(PROTOCOL_UDP, 17);
    EXPECT_EQ(PROTOCOL_ESP, 50);
    EXPECT_EQ(DIRECTION_UPLINK, 0);
    EXPECT_EQ(DIRECTION_DOWNLINK, 1);
    EXPECT_EQ(DSCP_ANY, -1);
    EXPECT_EQ(SOURCE_PORT_ANY, -1);
}

TEST(PolicyTypesTest, UserPriorityFollows8021D) {
    EXPECT_EQ(USER_PRIORITY_ANY, -1);
    EXPECT_EQ(USER_PRIORITY_BEST_EFFORT_LOW, 0);
    EXPECT_EQ(USER_PRIORITY_BACKGROUND_LOW, 1);
    EXPECT_EQ(USER_PRIORITY_BACKGROUND_HIGH, 2);
    EXPECT_EQ(USER_PRIORITY_BEST_EFFORT_HIGH, 3);
    EXPECT_EQ(USER_PRIORITY_VIDEO_LOW, 4);
    EXPECT_EQ(USER_PRIORITY_VIDEO_HIGH, 5);
    EXPECT_EQ(USER_PRIORITY_VOICE_LOW, 6);
    EXPECT_EQ(USER_PRIORITY_VOICE_HIGH, 7);
}

TEST(PolicyTypesTest, NamesForLogging) {
    EXPECT_EQ(direction_to_string(DIRECTION_UPLINK), "UPLINK");
    EXPECT_EQ(direction_to_string(DIRECTION_DOWNLINK), "DOWNLINK");
    EXPECT_EQ(direction_to_string(7), "UNKNOWN(7)");

    EXPECT_EQ(protocol_to_string(PROTOCOL_ESP), "ESP");
    EXPECT_EQ(protocol_to_string(PROTOCOL_ANY), "ANY");
    EXPECT_EQ(protocol_to_string(1), "UNKNOWN(1)");

    EXPECT_EQ(user_priority_to_string(USER_PRIORITY_VOICE_HIGH), "VOICE_HIGH");
    EXPECT_EQ(user_priority_to_string(USER_PRIORITY_BEST_EFFORT_LOW), "BEST_EFFORT_LOW");
    EXPECT_EQ(user_priority_to_string(8), "UNKNOWN(8)");

    EXPECT_EQ(rule_to_string(PolicyRule::UPLINK_REQUIRES_DSCP), "UPLINK_REQUIRES_DSCP");
}

} // namespace policy
} // namespace qospol
