// Demo entry point: builds two example policies, ships them through a parcel
// and checks that the decoded copies match.
//
// Usage: qospol_demo [--log-level <level>] [--log-file <path>]

#include "qospol/dataplane/mac_address.h"
#include "qospol/policy/policy_errors.h"
#include "qospol/policy/qos_policy_params.h"
#include "qospol/util/logger.h"
#include "qospol/wire/parcel.h"
#include "qospol/wire/policy_codec.h"

#include <exception>
#include <vector>

using namespace qospol;

int main(int argc, char* argv[]) {
    try {
        util::Logger::init(util::Logger::parse_cli_args(argc, argv));
    } catch (const policy::ArgumentError& e) {
        util::Logger::init(util::LogConfig{});
        SPDLOG_LOGGER_ERROR(util::Logger::instance(), "{}", e.what());
        return 1;
    }
    auto log = util::Logger::instance();

    try {
        // Mark outgoing voice traffic to a known peer with EF (46).
        policy::QosPolicyParams uplink =
            policy::QosPolicyParams::Builder(1, policy::DIRECTION_UPLINK)
                .set_dscp(46)
                .set_protocol(policy::PROTOCOL_UDP)
                .set_destination_address(dataplane::MacAddress::from_string("02:00:5e:10:00:01"))
                .set_destination_port_range(5060, 5061)
                .build();

        policy::QosPolicyParams downlink =
            policy::QosPolicyParams::Builder(2, policy::DIRECTION_DOWNLINK)
                .set_user_priority(policy::USER_PRIORITY_VIDEO_HIGH)
                .set_protocol(policy::PROTOCOL_TCP)
                .set_source_port(443)
                .build();

        SPDLOG_LOGGER_INFO(log, "uplink policy   {}", uplink.to_string());
        SPDLOG_LOGGER_INFO(log, "downlink policy {}", downlink.to_string());

        const std::vector<policy::QosPolicyParams> sent{uplink, downlink};
        wire::Parcel out;
        wire::write_policy_list(out, sent);
        SPDLOG_LOGGER_INFO(log, "encoded {} policies in {} bytes", sent.size(), out.data_size());

        wire::Parcel in(out.data());
        std::vector<policy::QosPolicyParams> received = wire::read_policy_list(in);

        bool ok = received == sent;
        for (auto& p : received) {
            // The receiver assigns its own IDs after accepting a policy.
            if (!p.validate()) {
                ok = false;
                continue;
            }
            p.set_translated_policy_id(p.get_policy_id() + 1000);
            SPDLOG_LOGGER_DEBUG(log, "accepted policy {} as {}", p.get_policy_id(),
                                p.get_translated_policy_id());
        }

        if (!ok) {
            SPDLOG_LOGGER_ERROR(log, "round trip mismatch");
            return 1;
        }
        SPDLOG_LOGGER_INFO(log, "round trip ok");
    } catch (const std::exception& e) {
        SPDLOG_LOGGER_ERROR(log, "{}", e.what());
        return 1;
    }
    return 0;
}
