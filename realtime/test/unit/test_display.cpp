#include <gtest/gtest.h>

#include "amisync/display.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

using namespace amisync;

namespace {

bool has_alias(const std::vector<std::string> &aliases, const std::string &alias) {
    return std::ranges::find(aliases, alias) != aliases.end();
}

} // namespace

TEST(AliasTest, EquivalentInterfacesShareExtension) {
    for (const char *value : { "PJSIP/101", "101", "Local/101;1", "Local/101@from-queue/n", "SIP/101-0000000a" }) {
        EXPECT_TRUE(has_alias(agent_aliases(value), "101")) << value;
    }
}

TEST(AliasTest, OrderAndDeduplication) {
    EXPECT_EQ(agent_aliases("  PJSIP/1001@office;x=1  "),
              (std::vector<std::string>{ "PJSIP/1001@office;x=1", "1001@office;x=1", "1001" }));
    EXPECT_EQ(agent_aliases("Local/2001-5"), (std::vector<std::string>{ "Local/2001-5", "2001-5", "2001" }));
    EXPECT_EQ(agent_aliases("101"), (std::vector<std::string>{ "101" }));
    EXPECT_TRUE(agent_aliases("   ").empty());
}

TEST(AliasTest, StandaloneExtensionsOnly) {
    // Digits glued to letters or longer than six do not count.
    const auto aliases = agent_aliases("Agent abc123 at 5551234567 ext 4321");
    EXPECT_TRUE(has_alias(aliases, "4321"));
    EXPECT_FALSE(has_alias(aliases, "123"));
    EXPECT_FALSE(has_alias(aliases, "5551234567"));
}

TEST(AliasTest, OperatorExtension) {
    EXPECT_EQ(operator_extension("PJSIP/101-00000001"), "101");
    EXPECT_EQ(operator_extension("42"), "42");
    EXPECT_EQ(operator_extension("PJSIP/trunk-provider"), "");
    EXPECT_EQ(operator_extension(""), "");
}

TEST(CallerIdTest, Parse) {
    EXPECT_EQ(parse_callerid("\"Alice Smith\" <101>"), (caller_id{ .name = "Alice Smith", .endpoint = "101" }));
    EXPECT_EQ(parse_callerid("Bob <PJSIP/102>"), (caller_id{ .name = "Bob", .endpoint = "102" }));
    EXPECT_EQ(parse_callerid("  \"Carol\"<PJSIP/103@pbx>  "), (caller_id{ .name = "Carol", .endpoint = "103" }));

    EXPECT_FALSE(parse_callerid("<101>").has_value());
    EXPECT_FALSE(parse_callerid("\"Dave\"").has_value());
    EXPECT_FALSE(parse_callerid("\"Eve\" <>").has_value());
    EXPECT_FALSE(parse_callerid("\"Eve\" <101> trailing").has_value());
    EXPECT_FALSE(parse_callerid("").has_value());
}

TEST(CallerIdTest, EndpointToken) {
    EXPECT_EQ(extract_endpoint_token("PJSIP/101"), "101");
    EXPECT_EQ(extract_endpoint_token("  office-101.a  "), "office-101.a");
    EXPECT_EQ(extract_endpoint_token("/"), "");
}

TEST(DisplayMapsTest, AgentLookupUsesAliases) {
    display_maps maps;
    maps.add_agent("PJSIP/101", "Alice");
    maps.add_agent("101", "Someone Else");

    EXPECT_EQ(maps.agent("Local/101;1"), "Alice");
    EXPECT_EQ(maps.agent("PJSIP/101"), "Alice");
    EXPECT_EQ(maps.agent("PJSIP/202"), "202");
    EXPECT_EQ(maps.agent("trunk"), "trunk");
}

TEST(DisplayMapsTest, HumanParty) {
    display_maps maps;
    maps.add_agent("101", "Alice");

    EXPECT_EQ(maps.human_party("101"), "Alice (101)");
    EXPECT_EQ(maps.human_party("202"), "202");
    EXPECT_EQ(maps.human_party("<unknown>"), "Unknown");
    EXPECT_EQ(maps.human_party(""), "Unknown");
}

TEST(DisplayMapsTest, HumanChannel) {
    display_maps maps;
    maps.add_agent("PJSIP/101", "Alice");

    EXPECT_EQ(maps.human_channel("PJSIP/101-0000002f"), "Alice [PJSIP]");
    EXPECT_EQ(maps.human_channel("PJSIP/303-0000002f"), "303 [PJSIP]");
    EXPECT_EQ(maps.human_channel("Message/ast_msg_queue"), "ast_msg_queue [Message]");
    EXPECT_EQ(maps.human_channel("console"), "console");
    EXPECT_EQ(maps.human_channel(""), "");
}

TEST(DisplayMapsTest, QueueLookup) {
    display_maps maps;
    maps.add_queue("600", "Support line");

    EXPECT_EQ(maps.queue("600"), "Support line");
    EXPECT_EQ(maps.queue("601"), "601");
}
