#include <campaign-sync/json.hpp>

#include <gtest/gtest.h>

using namespace campaign_sync;
using json = nlohmann::json;

namespace {

auto sample_entity() -> Entity {
    auto e = Entity{.id = "pc-1", .kind = EntityKind::pc, .name = "Ash"};
    e.fields["background"] = "Knight";
    e.tasks.push_back(SectionItem{.id = "t1", .text = "Find the bell", .done = true});
    e.stress[StressTrack::blood] = 4;
    e.fallout.push_back(Fallout{.id = "f1", .track = StressTrack::blood,
                                .severity = Severity::moderate, .created_at = 42});
    return e;
}

}  // namespace

// -- Field names --------------------------------------------------------------

TEST(Json, entity_uses_string_enums) {
    const auto j = json(sample_entity());

    EXPECT_EQ(j["kind"], "pc");
    EXPECT_EQ(j["stress"]["blood"], 4);
    EXPECT_EQ(j["fallout"][0]["severity"], "Moderate");
    EXPECT_EQ(j["fallout"][0]["track"], "blood");
    EXPECT_EQ(j["fallout"][0]["createdAt"], 42);
    EXPECT_EQ(j["tasks"][0]["done"], true);
}

TEST(Json, relationship_uses_from_and_to) {
    const auto j = json(Relationship{.id = "r1", .from_id = "a", .to_id = "b", .label = "rivals"});

    EXPECT_EQ(j["from"], "a");
    EXPECT_EQ(j["to"], "b");
    EXPECT_EQ(j["label"], "rivals");
}

TEST(Json, custom_rules_omit_unset_overrides) {
    auto rules = CustomRules{};
    rules.fallout_check_on_stress = false;
    const auto j = json(rules);

    EXPECT_EQ(j.size(), 1u);
    EXPECT_EQ(j["falloutCheckOnStress"], false);
    EXPECT_EQ(j.get<CustomRules>(), rules);
}

TEST(Json, campaign_set_round_trip) {
    auto set = make_default_campaign_set("c1");
    set.active()->entities.emplace("pc-1", sample_entity());
    set.active()->log.push_back(LogEntry{.at = 7, .text = "Session start"});
    set.active()->settings.rules_profile = "Custom";

    const auto back = json(set).get<CampaignSet>();
    EXPECT_EQ(back, set);
}

TEST(Json, missing_optional_fields_take_defaults) {
    const auto j = json::parse(R"({"campaigns": {"c1": {"id": "c1"}}})");
    const auto set = j.get<CampaignSet>();

    ASSERT_EQ(set.campaigns.size(), 1u);
    EXPECT_EQ(set.campaigns.at("c1").settings.rules_profile, "Core");
    EXPECT_TRUE(set.active_campaign_id.empty());
}

TEST(Json, unknown_enum_name_throws) {
    const auto j = json::parse(R"({"id": "x", "kind": "dragon"})");
    EXPECT_ANY_THROW((void)j.get<Entity>());
}

// -- Wire message -------------------------------------------------------------

TEST(Json, message_wire_format) {
    auto raw = std::array<std::byte, ClientId::size>{};
    raw[0] = std::byte{1};
    const auto msg = NotificationMessage{
        .revision = RevisionToken{"100-1-00"},
        .campaign_id = "c1",
        .actor = "Alice",
        .actor_role = "gm",
        .client_id = ClientId{raw},
        .time = 100,
    };
    const auto j = json::parse(encode_message(msg));

    EXPECT_EQ(j["type"], "campaign_saved");
    EXPECT_EQ(j["revision"], "100-1-00");
    EXPECT_EQ(j["campaignId"], "c1");
    EXPECT_EQ(j["actor"], "Alice");
    EXPECT_EQ(j["actorRole"], "gm");
    EXPECT_EQ(j["clientId"], "01000000000000000000000000000000");
    EXPECT_EQ(j["time"], 100);
    EXPECT_EQ(decode_message(encode_message(msg)), msg);
}

TEST(Json, decode_message_rejects_garbage) {
    EXPECT_FALSE(decode_message("").has_value());
    EXPECT_FALSE(decode_message("[1,2]").has_value());
    EXPECT_FALSE(decode_message(R"({"type": "campaign_saved"})").has_value());
    EXPECT_FALSE(decode_message(R"({"type": "campaign_saved", "clientId": "xyz"})").has_value());
}

// -- Queue --------------------------------------------------------------------

TEST(Json, queue_round_trip) {
    auto ops = std::vector<PendingOperation>{
        PendingOperation{
            .id = "op-1",
            .created_at = 5,
            .kind = OperationKind::save_campaigns,
            .base_revision = RevisionToken{"r0"},
            .campaign_id = "c1",
            .payload = make_default_campaign_set("c1"),
        },
    };

    const auto text = encode_queue(ops);
    EXPECT_NE(text.find("\"baseRevision\":\"r0\""), std::string::npos);
    EXPECT_EQ(decode_queue(text), ops);
}

TEST(Json, decode_queue_rejects_wrong_shape) {
    EXPECT_FALSE(decode_queue("{}").has_value());
    EXPECT_FALSE(decode_queue("not json").has_value());
    EXPECT_FALSE(decode_queue(R"([{"id": "op-1", "kind": "explode", "payload": {"campaigns": {}}}])").has_value());
    EXPECT_EQ(decode_queue("[]")->size(), 0u);
}
