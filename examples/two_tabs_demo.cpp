// two_tabs_demo: two views of the same campaigns detecting each other's writes
//
// Demonstrates: MemoryStorage views, LocalBus notifications, conflict
//               detection, and the three ways of resolving a conflict.

#include <campaign-sync/campaign_sync.hpp>

#include <cstdio>
#include <string>

namespace cs = campaign_sync;

static auto describe(const cs::SyncController& tab) -> std::string {
    const auto* camp = tab.session().campaigns.active();
    auto text = std::string{camp ? camp->name : "<none>"};
    text += " (" + std::to_string(camp ? camp->entities.size() : 0) + " entities, state ";
    text += cs::to_string_view(tab.state());
    text += ", indicator ";
    text += cs::to_string_view(tab.indicator().kind);
    text += ")";
    return text;
}

int main() {
    cs::configure_logging("warn");

    auto config = cs::SyncConfig{};
    config.user = "gm-alice";
    config.actor_label = "Alice";

    auto storage = cs::MemoryStorage{};
    auto bus = cs::LocalBus{};
    auto medium_a = storage.open();
    auto medium_b = storage.open();

    auto tab_a = cs::SyncController{config, *medium_a, bus.attach()};
    tab_a.open();
    tab_a.mutate_campaign("Renamed campaign", [](cs::Campaign& c) { c.name = "The Drowned Court"; });
    tab_a.add_entity(cs::Entity{.id = "pc-1", .kind = cs::EntityKind::pc, .name = "Ash"});

    auto tab_b = cs::SyncController{config, *medium_b, bus.attach()};
    tab_b.open();
    medium_b->on_external_change([&](std::string_view key) { tab_b.on_storage_change(key); });

    std::printf("=== Both tabs open ===\n");
    std::printf("A: %s\n", describe(tab_a).c_str());
    std::printf("B: %s\n", describe(tab_b).c_str());

    // --- Scenario 1: A writes, B is told ---
    std::printf("\n=== Scenario 1: A commits, B sees a conflict ===\n");
    tab_a.add_entity(cs::Entity{.id = "npc-1", .kind = cs::EntityKind::npc, .name = "Vell"});
    std::printf("B conflict active: %s\n", tab_b.conflicts().active() ? "yes" : "no");
    std::printf("B indicator: %s\n", tab_b.indicator().message.c_str());

    auto outcome = tab_b.mutate_campaign("Renamed campaign",
                                         [](cs::Campaign& c) { c.name = "B's idea"; });
    std::printf("B edit outcome: %s, queued: %zu\n",
                std::string{cs::to_string_view(outcome)}.c_str(), tab_b.queue().size());

    // --- Scenario 2: B takes the durable state ---
    std::printf("\n=== Scenario 2: B reloads latest ===\n");
    tab_b.resolve(cs::ResolutionKind::reload_latest);
    std::printf("B: %s\n", describe(tab_b).c_str());

    // --- Scenario 3: B wins an argument ---
    std::printf("\n=== Scenario 3: A writes again, B overwrites ===\n");
    tab_a.add_entity(cs::Entity{.id = "org-1", .kind = cs::EntityKind::organisation, .name = "Tide Guild"});
    tab_b.mutate_campaign("Renamed campaign", [](cs::Campaign& c) { c.name = "B insists"; });
    outcome = tab_b.resolve(cs::ResolutionKind::force_overwrite);
    std::printf("B overwrite outcome: %s\n", std::string{cs::to_string_view(outcome)}.c_str());
    std::printf("A conflict active: %s\n", tab_a.conflicts().active() ? "yes" : "no");

    tab_a.resolve(cs::ResolutionKind::reload_latest);
    std::printf("A: %s\n", describe(tab_a).c_str());
    std::printf("B: %s\n", describe(tab_b).c_str());

    return 0;
}
