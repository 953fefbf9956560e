#include <gtest/gtest.h>

#include "temp_database.hpp"

#include "amisync/mirror_errors.hpp"
#include "amisync/mirror_store.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace amisync;

namespace {

mirror_store open_store(const test::temp_database &db) {
    auto store = mirror_store::open(db.path());
    EXPECT_TRUE(store.has_value()) << store.error().message();
    return std::move(*store);
}

} // namespace

TEST(MirrorStoreTest, OpenCreatesSchemaIdempotently) {
    test::temp_database db;

    {
        auto store = open_store(db);
        ASSERT_FALSE(store.upsert_queue("support"));
    }

    auto reopened = open_store(db);
    const auto queues = reopened.queues();
    ASSERT_TRUE(queues.has_value());
    ASSERT_EQ(queues->size(), 1);
    EXPECT_EQ(queues->front(), (queue_row{ .name = "support", .descr = "support" }));
}

TEST(MirrorStoreTest, OpenFailureIsReported) {
    auto store = mirror_store::open("/nonexistent-directory/for/amisync/mirror.sqlite");
    ASSERT_FALSE(store.has_value());
    EXPECT_TRUE(store.error().category() == sqlite_category());
}

TEST(MirrorStoreTest, UpsertMemberAlsoUpsertsQueueAndAgent) {
    test::temp_database db;
    auto store = open_store(db);

    ASSERT_FALSE(store.upsert_member({ .queue_name = "support",
                                       .interface = "PJSIP/101",
                                       .penalty = 2,
                                       .paused = false,
                                       .member_name = "Alice" }));

    const auto members = store.members();
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 1);
    EXPECT_EQ(members->front(), (member_row{ .queue_name = "support",
                                             .interface = "PJSIP/101",
                                             .penalty = 2,
                                             .paused = false,
                                             .member_name = "Alice" }));

    const auto queues = store.queues();
    ASSERT_TRUE(queues.has_value());
    ASSERT_EQ(queues->size(), 1);
    EXPECT_EQ(queues->front().name, "support");

    const auto agents = store.agents();
    ASSERT_TRUE(agents.has_value());
    ASSERT_EQ(agents->size(), 1);
    EXPECT_EQ(agents->front(), (agent_row{ .agent = "PJSIP/101", .name = "Alice" }));
}

TEST(MirrorStoreTest, SnapshotThenPauseLeavesOnePausedRow) {
    test::temp_database db;
    auto store = open_store(db);

    ASSERT_FALSE(store.upsert_member(
        { .queue_name = "queueA", .interface = "memberX", .penalty = 0, .paused = false, .member_name = "X" }));
    ASSERT_FALSE(store.upsert_member(
        { .queue_name = "queueA", .interface = "memberX", .penalty = std::nullopt, .paused = true, .member_name = "" }));

    const auto members = store.members();
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 1);
    EXPECT_TRUE(members->front().paused);
    EXPECT_EQ(members->front().penalty, 0);
    EXPECT_EQ(members->front().member_name, "X");
}

TEST(MirrorStoreTest, AbsentFieldsKeepStoredValues) {
    test::temp_database db;
    auto store = open_store(db);

    ASSERT_FALSE(store.upsert_member(
        { .queue_name = "support", .interface = "PJSIP/101", .penalty = 5, .paused = true, .member_name = "Alice" }));
    ASSERT_FALSE(store.upsert_member({ .queue_name = "support",
                                       .interface = "PJSIP/101",
                                       .penalty = std::nullopt,
                                       .paused = std::nullopt,
                                       .member_name = "" }));

    const auto members = store.members();
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 1);
    EXPECT_EQ(members->front().penalty, 5);
    EXPECT_TRUE(members->front().paused);
    EXPECT_EQ(members->front().member_name, "Alice");

    const auto agents = store.agents();
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(agents->front().name, "Alice");
}

TEST(MirrorStoreTest, DeleteMemberRemovesOnlyThatRow) {
    test::temp_database db;
    auto store = open_store(db);

    ASSERT_FALSE(store.upsert_member({ .queue_name = "support", .interface = "PJSIP/101", .penalty = {}, .paused = {},
                                       .member_name = "" }));
    ASSERT_FALSE(store.upsert_member({ .queue_name = "sales", .interface = "PJSIP/101", .penalty = {}, .paused = {},
                                       .member_name = "" }));
    ASSERT_FALSE(store.delete_member("support", "PJSIP/101"));
    ASSERT_FALSE(store.delete_member("support", "PJSIP/999"));

    const auto members = store.members();
    ASSERT_TRUE(members.has_value());
    ASSERT_EQ(members->size(), 1);
    EXPECT_EQ(members->front().queue_name, "sales");

    // Queues and agents are never deleted.
    EXPECT_EQ(store.queues()->size(), 2);
    EXPECT_EQ(store.agents()->size(), 1);
}

TEST(MirrorStoreTest, EmptyKeysAreIgnored) {
    test::temp_database db;
    auto store = open_store(db);

    EXPECT_FALSE(store.upsert_queue(""));
    EXPECT_FALSE(store.upsert_agent(""));
    EXPECT_FALSE(store.upsert_member({ .queue_name = "", .interface = "PJSIP/101", .penalty = {}, .paused = {},
                                       .member_name = "" }));
    EXPECT_TRUE(store.queues()->empty());
    EXPECT_TRUE(store.agents()->empty());
    EXPECT_TRUE(store.members()->empty());
}

TEST(MirrorStoreTest, MappingsAreNeverOverwritten) {
    test::temp_database db;
    auto store = open_store(db);

    ASSERT_FALSE(store.ensure_agent_mapping("101", "Curated Name"));
    ASSERT_FALSE(store.ensure_agent_mapping("101", "Automatic Name"));
    ASSERT_FALSE(store.ensure_agent_mapping("PJSIP/101", "Automatic Name"));
    ASSERT_FALSE(store.ensure_queue_mapping("600", "Support"));
    ASSERT_FALSE(store.ensure_queue_mapping("600", "Other"));

    EXPECT_EQ(store.agent_mapping("101").value(), "Curated Name");
    EXPECT_EQ(store.agent_mapping("PJSIP/101").value(), "Automatic Name");
    EXPECT_FALSE(store.agent_mapping("102").value().has_value());

    const auto maps = store.load_display_maps();
    ASSERT_TRUE(maps.has_value());
    EXPECT_EQ(maps->agent("Local/101;1"), "Curated Name");
    EXPECT_EQ(maps->queue("600"), "Support");
}

TEST(MirrorStoreTest, ConnectConfigRoundTrip) {
    test::temp_database db;
    auto store = open_store(db);

    const auto missing = store.load_connect_config();
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), make_mirror_error(mirror_errc::settings_missing));

    ASSERT_FALSE(store.store_connect_config(
        { .hostname = "pbx.local", .port = "5038", .username = "monitor", .secret = "s3cret" }));
    ASSERT_FALSE(store.store_connect_config(
        { .hostname = "pbx2.local", .port = "5039", .username = "monitor", .secret = "other" }));

    const auto loaded = store.load_connect_config();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->hostname, "pbx2.local");
    EXPECT_EQ(loaded->port, "5039");
    EXPECT_EQ(loaded->username, "monitor");
    EXPECT_EQ(loaded->secret, "other");
    EXPECT_EQ(loaded->events, "on");
}
