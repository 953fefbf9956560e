#include <gtest/gtest.h>

#include "fake_ami_server.hpp"
#include "temp_database.hpp"

#include "detail/sync.hpp"

#include "amisync/actions.hpp"
#include "amisync/client.hpp"
#include "amisync/mirror_store.hpp"
#include "amisync/record.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace amisync;
using namespace std::chrono_literals;

namespace {

mirror_store open_store(const test::temp_database &db) {
    auto store = mirror_store::open(db.path());
    EXPECT_TRUE(store.has_value());
    return std::move(*store);
}

std::vector<record> queue_status_reply() {
    return {
        record{ { "Response", "Success" }, { "EventList", "start" } },
        record{ { "Event", "QueueParams" }, { "Queue", "queueA" } },
        record{ { "Event", "QueueMember" }, { "Queue", "queueA" }, { "Name", "Alice" }, { "Location", "PJSIP/101" },
                { "Penalty", "0" }, { "Paused", "0" } },
        record{ { "Event", "QueueParams" }, { "Queue", "queueB" } },
        record{ { "Event", "QueueMember" }, { "Queue", "queueB" }, { "MemberName", "Bob" },
                { "Interface", "PJSIP/102" }, { "Penalty", "3" }, { "Paused", "yes" } },
        record{ { "Event", "QueueStatusComplete" }, { "EventList", "Complete" } },
    };
}

} // namespace

TEST(SyncTest, ParseAmiBool) {
    for (const char *value : { "1", "yes", "TRUE", " on " }) {
        EXPECT_TRUE(detail::parse_ami_bool(value)) << value;
    }
    for (const char *value : { "0", "no", "false", "off", "", "2" }) {
        EXPECT_FALSE(detail::parse_ami_bool(value)) << value;
    }
}

TEST(SyncTest, ApplyQueueStatusUpsertsWithoutDeleting) {
    test::temp_database db;
    auto store = open_store(db);

    ASSERT_FALSE(store.upsert_member({ .queue_name = "queueC", .interface = "PJSIP/103", .penalty = {}, .paused = {},
                                       .member_name = "" }));

    const auto reply = queue_status_reply();
    ASSERT_FALSE(detail::apply_queue_status(store, actions::reshape_queue_status(reply)));

    const auto members = store.members();
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 3);
    EXPECT_EQ((*members)[0], (member_row{ .queue_name = "queueA",
                                          .interface = "PJSIP/101",
                                          .penalty = 0,
                                          .paused = false,
                                          .member_name = "Alice" }));
    EXPECT_EQ((*members)[1], (member_row{ .queue_name = "queueB",
                                          .interface = "PJSIP/102",
                                          .penalty = 3,
                                          .paused = true,
                                          .member_name = "Bob" }));
    EXPECT_EQ((*members)[2].queue_name, "queueC");
}

TEST(SyncTest, MembershipMirrorFollowsEvents) {
    test::temp_database db;
    auto store = open_store(db);

    const auto reply = queue_status_reply();
    ASSERT_FALSE(detail::apply_queue_status(store, actions::reshape_queue_status(reply)));

    // Pause without a name keeps the name.
    detail::apply_event(store, event(record{ { "Event", "QueueMemberPause" },
                                             { "Queue", "queueA" },
                                             { "Interface", "PJSIP/101" },
                                             { "Paused", "1" } }));

    auto members = store.members();
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 2);
    EXPECT_TRUE((*members)[0].paused);
    EXPECT_EQ((*members)[0].member_name, "Alice");

    // Added through Location, then removed.
    detail::apply_event(store, event(record{ { "Event", "QueueMemberAdded" },
                                             { "Queue", " queueA " },
                                             { "Location", "Local/104@from-queue/n" },
                                             { "MemberName", "Dave" },
                                             { "Penalty", "1" } }));
    members = store.members();
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 3);
    EXPECT_EQ((*members)[0].interface, "Local/104@from-queue/n");
    EXPECT_EQ((*members)[0].penalty, 1);

    detail::apply_event(store, event(record{ { "Event", "QueueMemberRemoved" },
                                             { "Queue", "queueA" },
                                             { "Interface", "Local/104@from-queue/n" } }));
    members = store.members();
    ASSERT_TRUE(members.has_value());
    EXPECT_EQ(members->size(), 2);

    // Queue events and unrelated events.
    detail::apply_event(store, event(record{ { "Event", "QueueSummary" }, { "Queue", "queueZ" } }));
    detail::apply_event(store, event(record{ { "Event", "Hangup" }, { "Queue", "queueY" } }));

    const auto queues = store.queues();
    ASSERT_TRUE(queues.has_value());
    ASSERT_EQ(queues->size(), 3);
    EXPECT_EQ(queues->back().name, "queueZ");
}

TEST(SyncTest, CallerIdSources) {
    const std::vector<record> endpoint = {
        record{ { "Response", "Success" }, { "EventList", "start" } },
        record{ { "Event", "EndpointDetail" }, { "ObjectName", "101" }, { "Callerid", "\"Alice\" <101>" } },
    };
    EXPECT_EQ(detail::callerid_from_endpoint(endpoint), "\"Alice\" <101>");

    const std::vector<record> odd_key = { record{ { "Event", "EndpointDetail" }, { "DefaultCallerID", " \"Eve\" <105>" } } };
    EXPECT_EQ(detail::callerid_from_endpoint(odd_key), "\"Eve\" <105>");

    const std::vector<record> none = { record{ { "Event", "EndpointDetail" }, { "ObjectName", "101" } } };
    EXPECT_EQ(detail::callerid_from_endpoint(none), "");

    const std::vector<record> command = {
        record{ { "Response", "Success" },
                { "Output", " Endpoint:  102/102" },
                { "Output", " callerid                     : \"Bob\" <102>" } },
    };
    EXPECT_EQ(detail::callerid_from_command(command), "\"Bob\" <102>");
}

TEST(SyncTest, FullSyncAndAgentMappingsOverTheWire) {
    test::fake_ami_server server;
    server.on_action("QueueStatus", [](const record &) { return queue_status_reply(); });
    server.on_action("PJSIPShowEndpoints", [](const record &) {
        return std::vector<record>{
            record{ { "Response", "Success" }, { "EventList", "start" } },
            record{ { "Event", "EndpointList" }, { "ObjectName", "102" } },
            record{ { "Event", "EndpointList" }, { "ObjectName", "trunk" } },
            record{ { "Event", "EndpointListComplete" }, { "EventList", "Complete" } },
        };
    });
    server.on_action("PJSIPShowEndpoint", [](const record &request) {
        std::vector<record> reply = { record{ { "Response", "Success" }, { "EventList", "start" } } };
        if (request.value_or("Endpoint") == "101") {
            reply.push_back(record{ { "Event", "EndpointDetail" }, { "Callerid", "\"Alice\" <101>" } });
        } else {
            reply.push_back(record{ { "Event", "EndpointDetail" }, { "ObjectName", std::string(request.value_or("Endpoint")) } });
        }
        reply.push_back(record{ { "Event", "EndpointDetailComplete" }, { "EventList", "Complete" } });
        return reply;
    });
    server.on_action("Command", [](const record &request) {
        if (request.value_or("Command") == "pjsip show endpoint 102") {
            return std::vector<record>{ record{ { "Response", "Success" },
                                                { "Output", " callerid : \"Bob\" <office-102>" } } };
        }
        return std::vector<record>{ record{ { "Response", "Success" }, { "Output", "No such endpoint" } } };
    });

    test::temp_database db;
    auto store = open_store(db);
    ASSERT_FALSE(store.ensure_agent_mapping("101", "Curated Alice"));

    auto cl = client::connect({
        .hostname = "127.0.0.1",
        .port = server.port(),
        .username = "admin",
        .secret = "pass",
        .action_timeout = 2'000ms,
        .login_timeout = 2'000ms,
        .poll_interval = 20ms,
    });
    ASSERT_TRUE(cl.has_value());

    ASSERT_FALSE(detail::full_sync(*cl, store));
    EXPECT_EQ(store.members()->size(), 2);

    detail::sync_agent_mappings(*cl, store);

    EXPECT_EQ(store.agent_mapping("101").value(), "Curated Alice");
    EXPECT_EQ(store.agent_mapping("PJSIP/101").value(), "Alice");
    EXPECT_EQ(store.agent_mapping("office-102").value(), "Bob");
    EXPECT_EQ(store.agent_mapping("PJSIP/office-102").value(), "Bob");
    EXPECT_EQ(store.agent_mapping("102").value(), "Bob");
    EXPECT_EQ(store.agent_mapping("PJSIP/102").value(), "Bob");
    EXPECT_FALSE(store.agent_mapping("trunk").value().has_value());

    // Each endpoint was asked once, in sorted order.
    const auto detail_requests = server.requests("PJSIPShowEndpoint");
    ASSERT_EQ(detail_requests.size(), 3);
    EXPECT_EQ(detail_requests[0].value_or("Endpoint"), "101");
    EXPECT_EQ(detail_requests[1].value_or("Endpoint"), "102");
    EXPECT_EQ(detail_requests[2].value_or("Endpoint"), "trunk");
}

TEST(SyncTest, StaleEndpointsCostOnlyTheLookupTimeout) {
    test::fake_ami_server server;
    server.on_action("PJSIPShowEndpoints", [](const record &) {
        return std::vector<record>{
            record{ { "Response", "Success" }, { "EventList", "start" } },
            record{ { "Event", "EndpointList" }, { "ObjectName", "ghost" } },
            record{ { "Event", "EndpointListComplete" }, { "EventList", "Complete" } },
        };
    });

    test::temp_database db;
    auto store = open_store(db);

    // Both lookups for "ghost" draw an error reply from the manager.
    auto cl = client::connect({
        .hostname = "127.0.0.1",
        .port = server.port(),
        .username = "admin",
        .secret = "pass",
        .action_timeout = 10'000ms,
        .login_timeout = 2'000ms,
        .poll_interval = 20ms,
    });
    ASSERT_TRUE(cl.has_value());

    const auto started = std::chrono::steady_clock::now();
    detail::sync_agent_mappings(*cl, store);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, (2 * detail::endpoint_lookup_timeout) + 2'000ms);
    EXPECT_EQ(server.requests("PJSIPShowEndpoint").size(), 1);
    EXPECT_EQ(server.requests("Command").size(), 1);
    EXPECT_FALSE(store.agent_mapping("ghost").value().has_value());
}
