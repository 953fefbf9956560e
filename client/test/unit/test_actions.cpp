#include <gtest/gtest.h>

#include "amisync/actions.hpp"
#include "amisync/record.hpp"

#include <vector>

using namespace amisync;

TEST(ActionsTest, ReshapeKeepsTrailingQueueWithoutCompletion) {
    const std::vector<record> records = {
        record{ { "Response", "Success" }, { "EventList", "start" } },
        record{ { "Event", "QueueMember" }, { "Queue", "orphan" } },
        record{ { "Event", "QueueParams" }, { "Queue", "sales" } },
        record{ { "Event", "QueueMember" }, { "Queue", "sales" }, { "Location", "PJSIP/201" } },
        record{ { "Event", "QueueParams" }, { "Queue", "support" } },
        record{ { "Event", "QueueMember" }, { "Queue", "support" }, { "Location", "PJSIP/101" } },
    };

    const auto queues = actions::reshape_queue_status(records);
    ASSERT_EQ(queues.size(), 2);
    EXPECT_EQ(queues[0].params.value_or("Queue"), "sales");
    EXPECT_EQ(queues[0].members.size(), 1);
    EXPECT_EQ(queues[1].params.value_or("Queue"), "support");
    ASSERT_EQ(queues[1].members.size(), 1);
    EXPECT_EQ(queues[1].members[0].value_or("Location"), "PJSIP/101");
}

TEST(ActionsTest, ReshapeEmptyReply) {
    EXPECT_TRUE(actions::reshape_queue_status({}).empty());

    const std::vector<record> complete_only = { record{ { "Event", "QueueStatusComplete" } } };
    EXPECT_TRUE(actions::reshape_queue_status(complete_only).empty());
}

TEST(ActionsTest, AnySuccess) {
    const std::vector<record> ok = { record{ { "Response", "Success" } } };
    const std::vector<record> err = { record{ { "Response", "Error" }, { "Message", "No such channel" } } };

    EXPECT_TRUE(actions::any_success(ok));
    EXPECT_FALSE(actions::any_success(err));
    EXPECT_FALSE(actions::any_success({}));
}

TEST(ActionsTest, CommandOutputLines) {
    const std::vector<record> records = {
        record{ { "Response", "Follows" }, { "Output", "Endpoint:  101/101" }, { "Output", "CallerID: \"Alice\" <101>" } },
        record{ { "Output", "trailer" } },
    };

    const auto lines = actions::command_output(records);
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[1], "CallerID: \"Alice\" <101>");
    EXPECT_EQ(lines[2], "trailer");
}
