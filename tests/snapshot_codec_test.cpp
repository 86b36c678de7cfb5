#include <campaign-sync/error.hpp>
#include <campaign-sync/snapshot_codec.hpp>

#include <gtest/gtest.h>

using namespace campaign_sync;

namespace {

auto populated_set(int entities) -> CampaignSet {
    auto set = make_default_campaign_set("c1");
    auto& camp = *set.active();
    for (int i = 0; i < entities; ++i) {
        auto id = "npc-" + std::to_string(i);
        auto e = Entity{.id = id, .kind = EntityKind::npc, .name = "Bystander " + std::to_string(i)};
        e.fields["notes"] = "Lives under the bridge and sells lamp oil to the guard.";
        camp.entities.emplace(id, std::move(e));
    }
    return set;
}

}  // namespace

TEST(SnapshotCodec, encode_decode_small_set) {
    const auto codec = SnapshotCodec{};
    const auto set = populated_set(2);

    const auto blob = codec.encode(set);
    EXPECT_EQ(blob[0], std::byte{'C'});
    EXPECT_EQ(blob[8], std::byte{0x00});  // stored as plain json
    EXPECT_EQ(codec.decode(blob), set);
}

TEST(SnapshotCodec, large_bodies_are_deflated) {
    const auto codec = SnapshotCodec{256};
    const auto set = populated_set(50);

    const auto blob = codec.encode(set);
    EXPECT_EQ(blob[8], std::byte{0x01});
    EXPECT_EQ(codec.decode(blob), set);
}

TEST(SnapshotCodec, decode_rejects_damage_without_throwing) {
    const auto codec = SnapshotCodec{};
    auto blob = codec.encode(populated_set(1));
    blob[blob.size() / 2] ^= std::byte{0x20};

    EXPECT_FALSE(codec.decode(blob).has_value());
    EXPECT_FALSE(codec.decode(to_blob("")).has_value());
    EXPECT_FALSE(codec.decode(to_blob(R"({"campaigns":{}})")).has_value());
}

TEST(SnapshotCodec, encode_fails_on_invalid_utf8) {
    auto set = make_default_campaign_set("c1");
    set.active()->name = std::string{"bad \xff\xfe name"};

    try {
        (void)SnapshotCodec{}.encode(set);
        FAIL() << "expected Failure";
    } catch (const Failure& e) {
        EXPECT_EQ(e.kind(), ErrorKind::storage_write_failure);
    }
}

TEST(SnapshotCodec, clone_is_isolated) {
    const auto original = populated_set(3);
    auto copy = SnapshotCodec::clone(original);
    copy.active()->entities.at("npc-0").name = "Renamed";
    copy.active()->entities.erase("npc-1");

    EXPECT_EQ(original.active()->entities.at("npc-0").name, "Bystander 0");
    EXPECT_EQ(original.active()->entities.size(), 3u);
}
