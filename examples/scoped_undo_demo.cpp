// scoped_undo_demo: undo one section or one relationship without touching the rest
//
// Demonstrates: section and relationship scopes, campaign-wide undo for
//               destructive edits, and stress with fallout as a single edit.

#include <campaign-sync/campaign_sync.hpp>

#include <cstdio>
#include <string>

namespace cs = campaign_sync;

static void show(const cs::SyncController& ctl) {
    const auto& camp = *ctl.session().campaigns.active();
    for (const auto& [id, entity] : camp.entities) {
        std::printf("  %s %s: %zu tasks, %zu items, blood %d, fallout %zu\n",
                    std::string{cs::to_string_view(entity.kind)}.c_str(), entity.name.c_str(),
                    entity.tasks.size(), entity.inventory.size(),
                    entity.stress_on(cs::StressTrack::blood), entity.fallout.size());
    }
    for (const auto& [id, rel] : camp.relationships) {
        std::printf("  %s -> %s (%s, strength %d)\n",
                    rel.from_id.c_str(), rel.to_id.c_str(), rel.label.c_str(), rel.strength);
    }
}

int main() {
    cs::configure_logging("warn");

    auto storage = cs::MemoryStorage{};
    auto bus = cs::LocalBus{};
    auto medium = storage.open();
    auto ctl = cs::SyncController{cs::SyncConfig{}, *medium, bus.attach(),
                                  cs::RevisionClock{}, cs::make_random_source(7)};
    ctl.open();

    const auto campaign = cs::campaign_scope(ctl.session().campaigns.active_campaign_id);

    ctl.add_entity(cs::Entity{.id = "pc-1", .kind = cs::EntityKind::pc, .name = "Ash"});
    ctl.add_entity(cs::Entity{.id = "npc-1", .kind = cs::EntityKind::npc, .name = "Vell"});
    ctl.add_relationship(cs::Relationship{.id = "rel-1", .from_id = "pc-1", .to_id = "npc-1",
                                          .label = "owes a debt", .strength = 1});

    ctl.mutate_section("pc-1", cs::SectionName::inventory, "Added item", [](cs::Section& s) {
        s.push_back(cs::SectionItem{.id = "item-1", .text = "Salt-cured rope"});
    });
    ctl.mutate_section("pc-1", cs::SectionName::tasks, "Added task", [](cs::Section& s) {
        s.push_back(cs::SectionItem{.id = "task-1", .text = "Find the drowned ledger"});
    });
    ctl.mutate_relationship("rel-1", "Deepened bond", [](cs::Relationship& r) { r.strength = 3; });

    std::printf("=== After editing ===\n");
    show(ctl);

    std::printf("\n=== Undo inventory only ===\n");
    ctl.undo(cs::section_scope("pc-1", cs::SectionName::inventory));
    show(ctl);

    std::printf("\n=== Undo the bond change only ===\n");
    ctl.undo(cs::relationship_scope("rel-1"));
    show(ctl);

    std::printf("\n=== Stress on Ash ===\n");
    for (int i = 0; i < 4; ++i) {
        auto outcome = ctl.apply_stress("pc-1", cs::StressTrack::blood, 3);
        if (outcome.fallout) {
            std::printf("  fallout: %s (rolled %d against %d, cleared %d)\n",
                        std::string{cs::to_string_view(outcome.fallout->fallout.severity)}.c_str(),
                        outcome.fallout->roll, outcome.fallout->total, outcome.fallout->cleared);
        }
    }
    show(ctl);

    std::printf("\n=== Delete Vell, then undo ===\n");
    ctl.delete_entity("npc-1");
    std::printf("Next undo: %s\n", ctl.history().peek_undo_label(campaign).value_or("-").c_str());
    show(ctl);
    ctl.undo(campaign);
    show(ctl);

    std::printf("\nRedo available: %s (%s)\n", ctl.history().can_redo(campaign) ? "yes" : "no",
                ctl.history().peek_redo_label(campaign).value_or("-").c_str());
    return 0;
}
