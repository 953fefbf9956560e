#include <gtest/gtest.h>

#include "amisync/display.hpp"
#include "amisync/record.hpp"
#include "amisync/snapshot.hpp"

#include <vector>

using namespace amisync;

namespace {

record channel(const char *name, const char *linkedid, const char *app, const char *duration,
               const char *caller = "101", const char *connected = "0501234567") {
    return record{
        { "Event", "CoreShowChannel" }, { "Channel", name },          { "Linkedid", linkedid },
        { "Application", app },         { "Duration", duration },     { "CallerIDNum", caller },
        { "ConnectedLineNum", connected },
    };
}

} // namespace

TEST(SnapshotTest, DurationToSeconds) {
    EXPECT_EQ(duration_to_seconds("75"), 75);
    EXPECT_EQ(duration_to_seconds("01:02:03"), 3723);
    EXPECT_EQ(duration_to_seconds(" 00:00:09 "), 9);
    EXPECT_EQ(duration_to_seconds("02:03"), 0);
    EXPECT_EQ(duration_to_seconds("1:2:3:4"), 0);
    EXPECT_EQ(duration_to_seconds("aa:bb:cc"), 0);
    EXPECT_EQ(duration_to_seconds(""), 0);
}

TEST(SnapshotTest, DurationRejectsOutOfRangeFields) {
    EXPECT_EQ(duration_to_seconds("9999999999999999:00:00"), 0);
    EXPECT_EQ(duration_to_seconds("1000001:00:00"), 0);
    EXPECT_EQ(duration_to_seconds("1000000:00:00"), 3'600'000'000);
    EXPECT_EQ(duration_to_seconds("00:60:00"), 0);
    EXPECT_EQ(duration_to_seconds("00:00:99999999999999"), 0);
    EXPECT_EQ(duration_to_seconds("-1:00:00"), 0);
    EXPECT_EQ(duration_to_seconds("00:-5:00"), 0);
}

TEST(SnapshotTest, RankOrdersLexicographically) {
    const auto queue = rank_channel(channel("A", "1", "Queue", "5"));
    const auto dial = rank_channel(channel("B", "1", "Dial", "500"));
    const auto other = rank_channel(channel("C", "1", "Playback", "9000"));

    EXPECT_EQ(queue.app_priority, 4);
    EXPECT_EQ(dial.app_priority, 3);
    EXPECT_EQ(other.app_priority, 1);
    EXPECT_GT(queue, dial);
    EXPECT_GT(dial, other);

    EXPECT_EQ(rank_channel(channel("D", "1", "AppQueue", "0", "<unknown>", "")).app_priority, 2);
    EXPECT_EQ(rank_channel(channel("D", "1", "AppQueue", "0", "<unknown>", "")).known_parties, 0);
    EXPECT_EQ(rank_channel(channel("D", "1", "dial", "0", "Unknown", "102")).known_parties, 1);
}

TEST(SnapshotTest, DialAndBridgeCollapseToLongerDuration) {
    const std::vector<record> rows = {
        channel("PJSIP/101-00000001", "call-1", "Dial", "00:00:10"),
        channel("PJSIP/trunk-00000002", "call-1", "Bridge", "00:00:42"),
    };

    const auto deduped = dedupe_channels(rows);
    ASSERT_EQ(deduped.size(), 1);
    EXPECT_EQ(deduped[0].value_or("Channel"), "PJSIP/trunk-00000002");
}

TEST(SnapshotTest, GroupingKeysAndOrder) {
    std::vector<record> rows = {
        channel("PJSIP/101-00000001", "", "Dial", "10"),
        channel("PJSIP/102-00000002", "", "Dial", "20"),
        channel("Message/ast_msg_queue", "m", "Queue", "99"),
        record{ { "Event", "CoreShowChannel" }, { "Channel", "PJSIP/103-00000003" }, { "BridgeId", "b-1" },
                { "Application", "AppQueue" } },
        record{ { "Event", "CoreShowChannel" }, { "Channel", "PJSIP/104-00000004" }, { "BridgeID", "b-1" },
                { "Application", "Queue" } },
        record{ { "Event", "CoreShowChannelsComplete" }, { "EventList", "Complete" } },
        record{ { "Response", "Success" }, { "EventList", "start" } },
    };

    const auto deduped = dedupe_channels(rows);
    ASSERT_EQ(deduped.size(), 3);
    EXPECT_EQ(deduped[0].value_or("Channel"), "PJSIP/101-00000001");
    EXPECT_EQ(deduped[1].value_or("Channel"), "PJSIP/102-00000002");
    EXPECT_EQ(deduped[2].value_or("Channel"), "PJSIP/104-00000004");
}

TEST(SnapshotTest, BuildSnapshot) {
    display_maps maps;
    maps.add_agent("PJSIP/101", "Alice");
    maps.add_queue("600", "Support");

    const std::vector<record> summary = {
        record{ { "Response", "Success" }, { "EventList", "start" } },
        record{ { "Event", "QueueSummary" }, { "Queue", "600" }, { "LoggedIn", "3" }, { "Available", "1" },
                { "Callers", "2" }, { "HoldTime", "12" }, { "LongestHoldTime", "40" } },
        record{ { "Event", "QueueSummary" }, { "Queue", "700" }, { "Callers", "x" } },
        record{ { "Event", "QueueSummaryComplete" }, { "EventList", "Complete" } },
    };
    const std::vector<record> channels = {
        channel("PJSIP/101-00000001", "call-1", "Queue", "00:01:00", "0501234567", "101"),
        channel("PJSIP/trunk-00000002", "call-1", "Dial", "00:01:00", "0501234567", "101"),
        channel("PJSIP/102-00000003", "call-2", "Dial", "15", "102", "103"),
    };

    const auto snap = build_snapshot(summary, channels, maps, {});

    ASSERT_EQ(snap.queue_summary.size(), 2);
    EXPECT_EQ(snap.queue_summary[0].queue_display, "Support");
    EXPECT_EQ(snap.queue_summary[0].logged_in, "3");
    EXPECT_EQ(snap.queue_summary[1].queue_display, "700");
    EXPECT_EQ(snap.queue_summary[1].logged_in, "0");
    EXPECT_EQ(snap.waiting_calls_count, 2);

    ASSERT_EQ(snap.active_calls_count, 2);
    EXPECT_EQ(snap.active_calls[0].callid, "call-1");
    EXPECT_EQ(snap.active_calls[0].channel, "Alice [PJSIP]");
    EXPECT_EQ(snap.active_calls[0].connected, "Alice (101)");
    EXPECT_EQ(snap.active_calls[0].application, "Queue");

    // 101 from the first call, 102 and 103 from the second.
    EXPECT_EQ(snap.active_operators_count, 3);
}

TEST(SnapshotTest, Filters) {
    display_maps maps;
    maps.add_agent("101", "Alice");

    const std::vector<record> summary = {
        record{ { "Event", "QueueSummary" }, { "Queue", "600" }, { "Callers", "1" } },
        record{ { "Event", "QueueSummary" }, { "Queue", "700" }, { "Callers", "4" } },
    };
    const std::vector<record> channels = {
        channel("PJSIP/101-00000001", "call-1", "Dial", "10", "101", "0501234567"),
        channel("PJSIP/102-00000002", "call-2", "Dial", "10", "102", "0509999999"),
    };

    const auto by_queue = build_snapshot(summary, channels, maps, { .queues = { "700" }, .channel = {}, .caller = {} });
    ASSERT_EQ(by_queue.queue_summary.size(), 1);
    EXPECT_EQ(by_queue.waiting_calls_count, 4);
    EXPECT_EQ(by_queue.active_calls_count, 2);

    const auto by_channel = build_snapshot(summary, channels, maps, { .queues = {}, .channel = " pjsip/102", .caller = {} });
    ASSERT_EQ(by_channel.active_calls_count, 1);
    EXPECT_EQ(by_channel.active_calls[0].callid, "call-2");

    // Display names are searchable too.
    const auto by_caller = build_snapshot(summary, channels, maps, { .queues = {}, .channel = {}, .caller = "ALICE" });
    ASSERT_EQ(by_caller.active_calls_count, 1);
    EXPECT_EQ(by_caller.active_calls[0].callid, "call-1");
}
