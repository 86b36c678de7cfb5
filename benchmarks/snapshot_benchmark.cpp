// campaign-sync benchmarks: cost of snapshots, commits and undo.

#include <campaign-sync/campaign_sync.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace campaign_sync;

static auto make_campaigns(std::int64_t entity_count) -> CampaignSet {
    auto set = make_default_campaign_set("bench");
    auto& camp = *set.active();
    for (std::int64_t i = 0; i < entity_count; ++i) {
        auto id = "npc-" + std::to_string(i);
        auto e = Entity{.id = id, .kind = EntityKind::npc, .name = "NPC " + std::to_string(i)};
        e.fields["notes"] = std::string(200, 'x');
        e.tasks.push_back(SectionItem{.id = id + "-t", .text = "Something to do"});
        e.stress[StressTrack::mind] = static_cast<int>(i % 10);
        camp.entities.emplace(id, std::move(e));
        if (i > 0) {
            auto rel_id = "rel-" + std::to_string(i);
            camp.relationships.emplace(rel_id, Relationship{
                .id = rel_id, .from_id = id, .to_id = "npc-" + std::to_string(i - 1), .label = "knows"});
        }
    }
    return set;
}

// =============================================================================
// Snapshots
// =============================================================================

static void bm_clone(benchmark::State& state) {
    const auto set = make_campaigns(state.range(0));
    for (auto _ : state) {
        auto copy = SnapshotCodec::clone(set);
        benchmark::DoNotOptimize(copy);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_clone)->Range(8, 512);

static void bm_encode(benchmark::State& state) {
    const auto set = make_campaigns(state.range(0));
    const auto codec = SnapshotCodec{};
    std::int64_t bytes = 0;
    for (auto _ : state) {
        auto blob = codec.encode(set);
        bytes += static_cast<std::int64_t>(blob.size());
        benchmark::DoNotOptimize(blob);
    }
    state.SetBytesProcessed(bytes);
}
BENCHMARK(bm_encode)->Range(8, 512);

static void bm_decode(benchmark::State& state) {
    const auto codec = SnapshotCodec{};
    const auto blob = codec.encode(make_campaigns(state.range(0)));
    for (auto _ : state) {
        auto set = codec.decode(blob);
        benchmark::DoNotOptimize(set);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(blob.size()));
}
BENCHMARK(bm_decode)->Range(8, 512);

// =============================================================================
// Controller round trips
// =============================================================================

static void bm_commit(benchmark::State& state) {
    auto storage = MemoryStorage{};
    auto bus = LocalBus{};
    auto medium = storage.open();
    auto ctl = SyncController{SyncConfig{}, *medium, bus.attach()};
    ctl.open();
    ctl.mutate_untracked([&](Campaign& c) { c = *make_campaigns(state.range(0)).active(); });
    const auto id = ctl.session().campaigns.active()->id;

    std::int64_t i = 0;
    for (auto _ : state) {
        ctl.mutate_section("npc-0", SectionName::inventory, "Added item", [&](Section& s) {
            s.push_back(SectionItem{.id = "i" + std::to_string(i++), .text = "coin"});
        });
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel(id);
}
BENCHMARK(bm_commit)->Range(8, 512);

static void bm_undo_redo(benchmark::State& state) {
    auto storage = MemoryStorage{};
    auto bus = LocalBus{};
    auto medium = storage.open();
    auto ctl = SyncController{SyncConfig{}, *medium, bus.attach()};
    ctl.open();
    ctl.mutate_untracked([&](Campaign& c) {
        auto id = c.id;
        c = *make_campaigns(state.range(0)).active();
        c.id = id;
    });
    const auto scope = campaign_scope(ctl.session().campaigns.active_campaign_id);
    ctl.delete_entity("npc-1");

    for (auto _ : state) {
        ctl.undo(scope);
        ctl.redo(scope);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_undo_redo)->Range(8, 512);
