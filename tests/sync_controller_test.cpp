#include <campaign-sync/error.hpp>
#include <campaign-sync/sync_controller.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <system_error>
#include <vector>

using namespace campaign_sync;

class SyncControllerTest : public ::testing::Test {
protected:
    SyncControllerTest() {
        config_.user = "alice";
        config_.actor_label = "Alice";
    }

    auto make(MemoryMedium& medium, std::unique_ptr<Transport> transport, std::uint64_t seed)
        -> std::unique_ptr<SyncController> {
        return std::make_unique<SyncController>(
            config_, medium, std::move(transport),
            RevisionClock{[this] { return now_; }, seed},
            [this] { return roll_; });
    }

    /// Open A, commit pc-1, then open B on top of that revision.
    void start_two_contexts(LocalBus& bus_a, LocalBus& bus_b) {
        a_ = make(*medium_a_, bus_a.attach(), 1);
        a_->open();
        ASSERT_EQ(a_->add_entity(pc("pc-1", "Ash")), SaveOutcome::saved);
        r0_ = a_->session().known_revision;

        b_ = make(*medium_b_, bus_b.attach(), 2);
        b_->open();
        ASSERT_EQ(b_->session().known_revision, r0_);
    }

    static auto pc(std::string id, std::string name) -> Entity {
        return Entity{.id = std::move(id), .kind = EntityKind::pc, .name = std::move(name)};
    }

    auto durable() -> CampaignSet {
        auto stored = a_->store().get("alice");
        EXPECT_TRUE(stored.has_value());
        return stored ? std::move(stored->campaigns) : CampaignSet{};
    }

    auto scope_of(SyncController& ctl) -> Scope {
        return campaign_scope(ctl.session().campaigns.active_campaign_id);
    }

    SyncConfig config_;
    Millis now_ = 1'000;
    double roll_ = 0.99;
    MemoryStorage storage_;
    std::unique_ptr<MemoryMedium> medium_a_ = storage_.open();
    std::unique_ptr<MemoryMedium> medium_b_ = storage_.open();
    LocalBus bus_;
    std::unique_ptr<SyncController> a_;
    std::unique_ptr<SyncController> b_;
    RevisionToken r0_;
};

// -- Lifecycle ----------------------------------------------------------------

TEST_F(SyncControllerTest, open_without_stored_state_starts_fresh) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();

    const auto* camp = a_->session().campaigns.active();
    ASSERT_NE(camp, nullptr);
    EXPECT_EQ(camp->name, "New Campaign");
    EXPECT_TRUE(a_->session().known_revision.empty());
    EXPECT_TRUE(a_->store().current_revision("alice").empty());
    EXPECT_EQ(a_->state(), SyncState::idle);
}

TEST_F(SyncControllerTest, open_loads_committed_state) {
    start_two_contexts(bus_, bus_);

    ASSERT_NE(b_->session().campaigns.active(), nullptr);
    EXPECT_NE(b_->session().campaigns.active()->find_entity("pc-1"), nullptr);
    EXPECT_EQ(b_->session().campaigns, a_->session().campaigns);
}

// -- Undo/redo as commits -----------------------------------------------------

TEST_F(SyncControllerTest, create_delete_undo_redo_advances_revision_each_time) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    const auto scope = scope_of(*a_);
    auto revisions = std::vector<RevisionToken>{a_->session().known_revision};

    auto original = pc("pc-1", "Ash");
    original.fields["drive"] = "Find my sister";
    ASSERT_EQ(a_->add_entity(original), SaveOutcome::saved);
    EXPECT_EQ(a_->history().peek_undo_label(scope), "Created PC");
    revisions.push_back(a_->session().known_revision);

    ASSERT_EQ(a_->delete_entity("pc-1"), SaveOutcome::saved);
    EXPECT_EQ(a_->history().peek_undo_label(scope), "Deleted PC");
    EXPECT_EQ(a_->session().campaigns.active()->find_entity("pc-1"), nullptr);
    revisions.push_back(a_->session().known_revision);

    ASSERT_EQ(a_->undo(scope), SaveOutcome::saved);
    const auto* restored = a_->session().campaigns.active()->find_entity("pc-1");
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(*restored, original);
    EXPECT_EQ(a_->history().redo_depth(scope), 1u);
    revisions.push_back(a_->session().known_revision);

    ASSERT_EQ(a_->redo(scope), SaveOutcome::saved);
    EXPECT_EQ(a_->session().campaigns.active()->find_entity("pc-1"), nullptr);
    EXPECT_EQ(a_->history().redo_depth(scope), 0u);
    revisions.push_back(a_->session().known_revision);

    auto distinct = std::set<std::string>{};
    for (const auto& r : revisions) distinct.insert(r.value);
    EXPECT_EQ(distinct.size(), 5u);
    EXPECT_EQ(a_->store().current_revision("alice"), revisions.back());
    EXPECT_EQ(durable().active()->find_entity("pc-1"), nullptr);
}

TEST_F(SyncControllerTest, undo_with_nothing_recorded) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    EXPECT_FALSE(a_->undo(scope_of(*a_)).has_value());
    EXPECT_FALSE(a_->redo(scope_of(*a_)).has_value());
    EXPECT_FALSE(a_->undo(campaign_scope("some-other-campaign")).has_value());
}

TEST_F(SyncControllerTest, relationship_undo_leaves_other_edits_alone) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(pc("pc-1", "Ash"));
    a_->add_entity(Entity{.id = "npc-1", .kind = EntityKind::npc, .name = "Vell"});
    ASSERT_EQ(a_->add_relationship(Relationship{.id = "r1", .from_id = "pc-1", .to_id = "npc-1",
                                                .label = "owes", .strength = 1}),
              SaveOutcome::saved);
    a_->mutate_relationship("r1", "Strengthened bond", [](Relationship& r) { r.strength = 3; });
    a_->mutate_campaign("Renamed campaign", [](Campaign& c) { c.name = "Renamed"; });

    const auto rel = relationship_scope("r1");
    EXPECT_EQ(a_->history().peek_undo_label(rel), "Strengthened bond");

    ASSERT_EQ(a_->undo(rel), SaveOutcome::saved);
    const auto& camp = *a_->session().campaigns.active();
    EXPECT_EQ(camp.find_relationship("r1")->strength, 1);
    EXPECT_EQ(camp.name, "Renamed");

    ASSERT_EQ(a_->undo(rel), SaveOutcome::saved);
    EXPECT_EQ(a_->session().campaigns.active()->find_relationship("r1"), nullptr);
    EXPECT_FALSE(a_->undo(rel).has_value());
    EXPECT_EQ(a_->history().redo_depth(rel), 2u);
}

TEST_F(SyncControllerTest, section_undo_is_independent_per_section) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(pc("pc-1", "Ash"));
    a_->mutate_section("pc-1", SectionName::inventory, "Added item", [](Section& s) {
        s.push_back(SectionItem{.id = "i1", .text = "Rope"});
    });
    a_->mutate_section("pc-1", SectionName::tasks, "Added task", [](Section& s) {
        s.push_back(SectionItem{.id = "t1", .text = "Find the ledger"});
    });

    ASSERT_EQ(a_->undo(section_scope("pc-1", SectionName::inventory)), SaveOutcome::saved);

    const auto& ash = *a_->session().campaigns.active()->find_entity("pc-1");
    EXPECT_TRUE(ash.inventory.empty());
    ASSERT_EQ(ash.tasks.size(), 1u);
    EXPECT_EQ(ash.tasks[0].text, "Find the ledger");
    EXPECT_TRUE(durable().active()->find_entity("pc-1")->inventory.empty());
}

TEST_F(SyncControllerTest, section_undo_skipped_when_entity_is_gone) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(pc("pc-1", "Ash"));
    a_->mutate_section("pc-1", SectionName::bonds, "Added bond", [](Section& s) {
        s.push_back(SectionItem{.id = "b1", .text = "Vell"});
    });
    a_->delete_entity("pc-1");

    const auto sec = section_scope("pc-1", SectionName::bonds);
    EXPECT_FALSE(a_->undo(sec).has_value());
    EXPECT_EQ(a_->history().undo_depth(sec), 0u);
    EXPECT_EQ(a_->session().campaigns.active()->find_entity("pc-1"), nullptr);
}

TEST_F(SyncControllerTest, delete_entity_takes_its_relationships) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(pc("pc-1", "Ash"));
    a_->add_entity(pc("pc-2", "Bren"));
    a_->add_relationship(Relationship{.id = "r1", .from_id = "pc-1", .to_id = "pc-2"});

    a_->delete_entity("pc-2");
    EXPECT_TRUE(a_->session().campaigns.active()->relationships.empty());

    a_->undo(scope_of(*a_));
    EXPECT_NE(a_->session().campaigns.active()->find_relationship("r1"), nullptr);
}

TEST_F(SyncControllerTest, throwing_mutation_rolls_back) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(pc("pc-1", "Ash"));
    const auto before = a_->session().campaigns;
    const auto revision = a_->store().current_revision("alice");
    const auto depth = a_->history().undo_depth(scope_of(*a_));

    EXPECT_THROW(a_->mutate_campaign("Broken edit", [](Campaign& c) {
        c.name = "half done";
        throw std::runtime_error{"validation failed"};
    }), std::runtime_error);

    EXPECT_EQ(a_->session().campaigns, before);
    EXPECT_EQ(a_->store().current_revision("alice"), revision);
    EXPECT_EQ(a_->history().undo_depth(scope_of(*a_)), depth);
}

TEST_F(SyncControllerTest, bad_arguments) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(pc("pc-1", "Ash"));

    EXPECT_THROW(a_->add_entity(pc("pc-1", "Again")), std::invalid_argument);
    EXPECT_THROW(a_->delete_entity("ghost"), Failure);
    EXPECT_THROW(a_->add_relationship(Relationship{.id = "r1", .from_id = "pc-1", .to_id = "ghost"}),
                 Failure);
    EXPECT_THROW(a_->mutate_relationship("r9", "x", [](Relationship&) {}), Failure);
    EXPECT_THROW(a_->mutate_section("ghost", SectionName::tasks, "x", [](Section&) {}), Failure);
}

TEST_F(SyncControllerTest, generated_ids_use_kind_prefix) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(Entity{.kind = EntityKind::npc, .name = "Nameless"});
    a_->add_entity(Entity{.kind = EntityKind::npc, .name = "Nameless"});

    const auto& entities = a_->session().campaigns.active()->entities;
    ASSERT_EQ(entities.size(), 2u);
    for (const auto& [id, entity] : entities) {
        EXPECT_EQ(id.rfind("npc-", 0), 0u);
        EXPECT_EQ(entity.id, id);
    }
}

// -- Rules --------------------------------------------------------------------

TEST_F(SyncControllerTest, stress_triggers_fallout_as_one_edit) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    auto ash = pc("pc-1", "Ash");
    ash.stress = {{StressTrack::blood, 5}, {StressTrack::mind, 1}};
    a_->add_entity(ash);
    roll_ = 0.1;

    auto outcome = a_->apply_stress("pc-1", StressTrack::blood, 1);

    EXPECT_EQ(outcome.save, SaveOutcome::saved);
    ASSERT_TRUE(outcome.fallout.has_value());
    EXPECT_EQ(outcome.fallout->fallout.severity, Severity::moderate);
    EXPECT_EQ(outcome.fallout->cleared, 5);

    const auto& camp = *a_->session().campaigns.active();
    const auto& hurt = *camp.find_entity("pc-1");
    EXPECT_EQ(hurt.stress_on(StressTrack::blood), 1);
    EXPECT_EQ(hurt.stress_on(StressTrack::mind), 1);
    ASSERT_EQ(hurt.fallout.size(), 1u);
    ASSERT_FALSE(camp.log.empty());
    EXPECT_NE(camp.log.back().text.find("Moderate"), std::string::npos);
    EXPECT_EQ(a_->history().peek_undo_label(scope_of(*a_)), "Stress on Ash");

    a_->undo(scope_of(*a_));
    const auto& healed = *a_->session().campaigns.active()->find_entity("pc-1");
    EXPECT_EQ(healed.stress_on(StressTrack::blood), 5);
    EXPECT_TRUE(healed.fallout.empty());
}

TEST_F(SyncControllerTest, quickstart_clamps_without_fallout) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    a_->add_entity(pc("pc-1", "Ash"));
    a_->mutate_untracked([](Campaign& c) { c.settings.rules_profile = "Quickstart"; });
    roll_ = 0.0;

    auto outcome = a_->apply_stress("pc-1", StressTrack::shadow, 15);

    EXPECT_FALSE(outcome.fallout.has_value());
    EXPECT_EQ(a_->session().campaigns.active()->find_entity("pc-1")->stress_on(StressTrack::shadow), 10);
}

TEST_F(SyncControllerTest, negative_stress_never_rolls) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    auto ash = pc("pc-1", "Ash");
    ash.stress = {{StressTrack::mind, 8}};
    a_->add_entity(ash);
    roll_ = 0.0;

    auto outcome = a_->apply_stress("pc-1", StressTrack::mind, -10);

    EXPECT_FALSE(outcome.fallout.has_value());
    EXPECT_EQ(a_->session().campaigns.active()->find_entity("pc-1")->stress_on(StressTrack::mind), 0);
}

TEST_F(SyncControllerTest, extreme_stress_amounts_clamp) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    auto ash = pc("pc-1", "Ash");
    ash.stress = {{StressTrack::blood, 4}};
    a_->add_entity(ash);

    a_->apply_stress("pc-1", StressTrack::blood, std::numeric_limits<int>::max());
    EXPECT_EQ(a_->session().campaigns.active()->find_entity("pc-1")->stress_on(StressTrack::blood), 10);

    a_->apply_stress("pc-1", StressTrack::blood, std::numeric_limits<int>::min());
    EXPECT_EQ(a_->session().campaigns.active()->find_entity("pc-1")->stress_on(StressTrack::blood), 0);
}

// -- Conflicts ----------------------------------------------------------------

TEST_F(SyncControllerTest, announced_commit_raises_conflict_in_other_context) {
    start_two_contexts(bus_, bus_);

    a_->add_entity(pc("pc-2", "Bren"));
    const auto r1 = a_->session().known_revision;

    EXPECT_TRUE(b_->conflicts().active());
    EXPECT_EQ(b_->conflicts().state().since_revision, r0_);
    EXPECT_EQ(b_->conflicts().state().observed_revision, r1);
    EXPECT_EQ(b_->indicator().kind, IndicatorKind::conflict);
    EXPECT_TRUE(b_->indicator().sticky);
    EXPECT_FALSE(a_->conflicts().active());
}

TEST_F(SyncControllerTest, stale_context_cannot_clobber) {
    auto bus_b = LocalBus{};
    start_two_contexts(bus_, bus_b);

    a_->add_entity(pc("pc-2", "Bren"));
    const auto r1 = a_->store().current_revision("alice");
    EXPECT_FALSE(b_->conflicts().active());

    auto outcome = b_->mutate_campaign("Renamed", [](Campaign& c) { c.name = "B's name"; });

    EXPECT_EQ(outcome, SaveOutcome::conflict_blocked);
    EXPECT_EQ(b_->state(), SyncState::idle);
    EXPECT_TRUE(b_->conflicts().active());
    EXPECT_EQ(b_->store().current_revision("alice"), r1);
    EXPECT_NE(durable().active()->find_entity("pc-2"), nullptr);
    EXPECT_NE(durable().active()->name, "B's name");
    EXPECT_EQ(b_->queue().size(), 1u);
    EXPECT_EQ(b_->queue().entries()[0].base_revision, r0_);
}

TEST_F(SyncControllerTest, edits_during_conflict_are_counted_and_queued) {
    start_two_contexts(bus_, bus_);
    a_->add_entity(pc("pc-2", "Bren"));

    b_->mutate_campaign("One", [](Campaign& c) { c.name = "one"; });
    b_->mutate_campaign("Two", [](Campaign& c) { c.name = "two"; });

    EXPECT_EQ(b_->conflicts().state().local_edit_count, 2u);
    EXPECT_EQ(b_->queue().size(), 2u);
    EXPECT_EQ(b_->indicator().kind, IndicatorKind::conflict);
}

TEST_F(SyncControllerTest, storage_change_hook_detects_conflict) {
    auto bus_b = LocalBus{};
    start_two_contexts(bus_, bus_b);
    medium_b_->on_external_change([this](std::string_view key) { b_->on_storage_change(key); });

    a_->add_entity(pc("pc-2", "Bren"));

    EXPECT_TRUE(b_->conflicts().active());
}

TEST_F(SyncControllerTest, check_consistency_detects_silent_commit) {
    auto bus_b = LocalBus{};
    start_two_contexts(bus_, bus_b);
    EXPECT_FALSE(b_->check_consistency());

    a_->add_entity(pc("pc-2", "Bren"));
    EXPECT_TRUE(b_->check_consistency());
}

TEST_F(SyncControllerTest, force_overwrite_commits_local_state) {
    start_two_contexts(bus_, bus_);
    a_->add_entity(pc("pc-2", "Bren"));
    b_->mutate_campaign("Renamed", [](Campaign& c) { c.name = "B's name"; });

    EXPECT_EQ(b_->resolve(ResolutionKind::force_overwrite), SaveOutcome::saved);

    EXPECT_FALSE(b_->conflicts().active());
    EXPECT_TRUE(b_->queue().empty());
    EXPECT_EQ(b_->indicator().kind, IndicatorKind::saved);
    EXPECT_EQ(durable().active()->name, "B's name");
    EXPECT_EQ(b_->session().known_revision, b_->store().current_revision("alice"));
    // A now holds a stale view and is told so.
    EXPECT_TRUE(a_->conflicts().active());
}

TEST_F(SyncControllerTest, failed_overwrite_keeps_conflict) {
    start_two_contexts(bus_, bus_);
    a_->add_entity(pc("pc-2", "Bren"));
    b_->mutate_campaign("Renamed", [](Campaign& c) { c.name = "B's name"; });
    storage_.fail_writes_when([](std::string_view key) { return key == "alice/campaigns"; });

    EXPECT_EQ(b_->resolve(ResolutionKind::force_overwrite), SaveOutcome::write_failed);
    EXPECT_TRUE(b_->conflicts().active());
    EXPECT_EQ(b_->queue().size(), 1u);
}

TEST_F(SyncControllerTest, reload_latest_discards_local_edits) {
    start_two_contexts(bus_, bus_);
    a_->add_entity(pc("pc-2", "Bren"));
    b_->mutate_campaign("Renamed", [](Campaign& c) { c.name = "B's name"; });

    EXPECT_EQ(b_->resolve(ResolutionKind::reload_latest), SaveOutcome::saved);

    EXPECT_FALSE(b_->conflicts().active());
    EXPECT_TRUE(b_->queue().empty());
    EXPECT_EQ(b_->session().campaigns, a_->session().campaigns);
    EXPECT_EQ(b_->session().known_revision, a_->session().known_revision);
    EXPECT_EQ(b_->indicator().message, "Reloaded latest");
    EXPECT_FALSE(b_->history().can_undo(scope_of(*b_)));

    EXPECT_EQ(b_->mutate_campaign("Renamed", [](Campaign& c) { c.name = "Agreed"; }), SaveOutcome::saved);
}

TEST_F(SyncControllerTest, dismiss_hides_until_next_edit) {
    start_two_contexts(bus_, bus_);
    a_->add_entity(pc("pc-2", "Bren"));
    ASSERT_EQ(b_->indicator().kind, IndicatorKind::conflict);

    EXPECT_EQ(b_->resolve(ResolutionKind::dismiss), SaveOutcome::conflict_blocked);
    EXPECT_NE(b_->indicator().kind, IndicatorKind::conflict);
    EXPECT_TRUE(b_->conflicts().active());

    EXPECT_EQ(b_->mutate_campaign("Renamed", [](Campaign& c) { c.name = "x"; }),
              SaveOutcome::conflict_blocked);
    EXPECT_EQ(b_->indicator().kind, IndicatorKind::conflict);
}

// -- Offline and failures -----------------------------------------------------

TEST_F(SyncControllerTest, offline_edits_queue_then_flush) {
    start_two_contexts(bus_, bus_);

    EXPECT_FALSE(a_->set_online(false).has_value());
    EXPECT_EQ(a_->add_entity(pc("pc-2", "Bren")), SaveOutcome::offline);
    EXPECT_EQ(a_->add_entity(pc("pc-3", "Cato")), SaveOutcome::offline);

    EXPECT_EQ(a_->indicator().kind, IndicatorKind::offline_queued);
    EXPECT_EQ(a_->queue().size(), 2u);
    EXPECT_EQ(a_->store().current_revision("alice"), r0_);
    EXPECT_FALSE(b_->conflicts().active());

    EXPECT_EQ(a_->set_online(true), SaveOutcome::saved);
    EXPECT_TRUE(a_->queue().empty());
    EXPECT_NE(durable().active()->find_entity("pc-3"), nullptr);
    EXPECT_EQ(a_->session().known_revision, a_->store().current_revision("alice"));
    EXPECT_EQ(a_->indicator().kind, IndicatorKind::saved);
    EXPECT_TRUE(b_->conflicts().active());
}

TEST_F(SyncControllerTest, queue_survives_reopen) {
    start_two_contexts(bus_, bus_);
    a_->set_online(false);
    a_->add_entity(pc("pc-2", "Bren"));

    auto medium_c = storage_.open();
    auto c = make(*medium_c, bus_.attach(), 3);
    c->open();

    EXPECT_EQ(c->queue().size(), 1u);
    EXPECT_EQ(c->indicator().kind, IndicatorKind::offline_queued);
    EXPECT_EQ(c->retry(), SaveOutcome::saved);
    EXPECT_NE(durable().active()->find_entity("pc-2"), nullptr);
}

TEST_F(SyncControllerTest, stale_queue_is_rejected_on_reconnect) {
    auto bus_b = LocalBus{};
    start_two_contexts(bus_, bus_b);
    b_->set_online(false);
    b_->mutate_campaign("Renamed", [](Campaign& c) { c.name = "offline name"; });

    a_->add_entity(pc("pc-2", "Bren"));
    const auto r1 = a_->store().current_revision("alice");

    EXPECT_EQ(b_->set_online(true), SaveOutcome::conflict_blocked);
    EXPECT_TRUE(b_->conflicts().active());
    EXPECT_EQ(b_->conflicts().state().observed_revision, r1);
    EXPECT_EQ(b_->store().current_revision("alice"), r1);
    EXPECT_NE(durable().active()->name, "offline name");
    EXPECT_EQ(b_->queue().size(), 1u);
}

TEST_F(SyncControllerTest, write_failure_then_retry) {
    start_two_contexts(bus_, bus_);
    storage_.fail_writes_when([](std::string_view key) { return key == "alice/campaigns-backup"; });

    EXPECT_EQ(a_->add_entity(pc("pc-2", "Bren")), SaveOutcome::write_failed);
    EXPECT_EQ(a_->indicator().kind, IndicatorKind::write_failed);
    EXPECT_FALSE(a_->indicator().sticky);
    EXPECT_EQ(a_->store().current_revision("alice"), r0_);
    EXPECT_EQ(durable().active()->find_entity("pc-2"), nullptr);
    EXPECT_TRUE(a_->queue().empty());

    storage_.fail_writes_when([](std::string_view) { return false; });
    EXPECT_EQ(a_->retry(), SaveOutcome::saved);
    EXPECT_NE(durable().active()->find_entity("pc-2"), nullptr);
}

TEST_F(SyncControllerTest, retry_after_failed_flush_commits_later_edits) {
    start_two_contexts(bus_, bus_);
    a_->set_online(false);
    ASSERT_EQ(a_->add_entity(pc("pc-2", "Bren")), SaveOutcome::offline);

    storage_.fail_writes_when([](std::string_view key) { return key == "alice/campaigns"; });
    EXPECT_EQ(a_->set_online(true), SaveOutcome::write_failed);
    EXPECT_EQ(a_->queue().size(), 1u);
    EXPECT_EQ(a_->add_entity(pc("pc-3", "Cato")), SaveOutcome::write_failed);
    EXPECT_EQ(a_->queue().size(), 2u);
    EXPECT_EQ(a_->store().current_revision("alice"), r0_);

    storage_.fail_writes_when({});
    EXPECT_EQ(a_->retry(), SaveOutcome::saved);
    EXPECT_EQ(a_->indicator().kind, IndicatorKind::saved);
    EXPECT_TRUE(a_->queue().empty());

    const auto stored = durable();
    EXPECT_NE(stored.active()->find_entity("pc-2"), nullptr);
    EXPECT_NE(stored.active()->find_entity("pc-3"), nullptr);
    EXPECT_EQ(stored, a_->session().campaigns);
}

TEST_F(SyncControllerTest, discard_pending_clears_offline_indicator) {
    start_two_contexts(bus_, bus_);
    a_->set_online(false);
    a_->add_entity(pc("pc-2", "Bren"));
    const auto id = a_->queue().entries()[0].id;

    EXPECT_EQ(a_->discard_pending({id}), 1u);
    EXPECT_TRUE(a_->queue().empty());
    EXPECT_EQ(a_->indicator().kind, IndicatorKind::none);
}

// -- Observation --------------------------------------------------------------

TEST_F(SyncControllerTest, state_listener_sees_every_transition) {
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    auto states = std::vector<SyncState>{};
    a_->on_state([&](SyncState s, const Indicator&) { states.push_back(s); });

    a_->add_entity(pc("pc-1", "Ash"));
    EXPECT_EQ(states, (std::vector<SyncState>{SyncState::saving, SyncState::saved, SyncState::idle}));

    states.clear();
    a_->set_online(false);
    a_->add_entity(pc("pc-2", "Bren"));
    EXPECT_EQ(states, (std::vector<SyncState>{SyncState::saving, SyncState::offline, SyncState::idle}));
}

TEST_F(SyncControllerTest, connect_remote_needs_configuration) {
    class NeverConnect : public RemoteConnector {
    public:
        auto connect(const RemoteConfig&) -> std::unique_ptr<Transport> override {
            throw Failure{ErrorKind::transport_unavailable, "offline"};
        }
    };

    a_ = make(*medium_a_, bus_.attach(), 1);
    auto connector = NeverConnect{};
    EXPECT_FALSE(a_->connect_remote(connector));

    config_.remote = RemoteConfig{.endpoint = "wss://relay.example"};
    b_ = make(*medium_b_, bus_.attach(), 2);
    EXPECT_FALSE(b_->connect_remote(connector));
    EXPECT_TRUE(b_->notifier().downgrade_reason().has_value());
    EXPECT_EQ(b_->notifier().transport_name(), "local");
}

TEST_F(SyncControllerTest, broken_remote_never_fails_a_save) {
    class ResetTransport : public Transport {
    public:
        void send(std::string_view) override {
            throw std::system_error{std::make_error_code(std::errc::connection_reset)};
        }
        void on_receive(ReceiveHandler) override {}
        auto name() const -> std::string_view override { return "relay"; }
    };
    class ResetConnector : public RemoteConnector {
    public:
        auto connect(const RemoteConfig&) -> std::unique_ptr<Transport> override {
            return std::make_unique<ResetTransport>();
        }
    };

    config_.remote = RemoteConfig{.endpoint = "wss://relay.example"};
    a_ = make(*medium_a_, bus_.attach(), 1);
    a_->open();
    auto connector = ResetConnector{};
    ASSERT_TRUE(a_->connect_remote(connector));

    auto outcome = SaveOutcome::write_failed;
    EXPECT_NO_THROW(outcome = a_->add_entity(pc("pc-1", "Ash")));
    EXPECT_EQ(outcome, SaveOutcome::saved);
    EXPECT_EQ(a_->state(), SyncState::idle);
    EXPECT_EQ(a_->notifier().transport_name(), "local");
    EXPECT_NE(durable().active()->find_entity("pc-1"), nullptr);
}
