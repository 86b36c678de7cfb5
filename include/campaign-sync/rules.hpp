/// @file rules.hpp
/// @brief Stress and fallout rules applied as secondary mutations.
///
/// Pure functions of entity state and an injectable random source. The
/// SyncController calls them from inside a mutation so the fallout they
/// create is committed, undone and redone together with the stress that
/// caused it.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/types.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace campaign_sync {

/// Boxes per stress track; stress beyond this does not count toward fallout.
inline constexpr int max_stress_per_track = 10;

/// The rules switches in effect for a campaign.
struct RulesConfig {
    bool difficulty_downgrades{true};
    bool fallout_check_on_stress{true};
    bool clear_stress_on_fallout{true};

    auto operator==(const RulesConfig&) const -> bool = default;
};

/// Resolve a campaign's rules profile.
///
/// `Quickstart` turns the fallout check and stress clearing off; `Custom`
/// starts from the core rules and applies the campaign's overrides. Any
/// other profile name means the core rules.
auto rules_config(const Settings& settings) -> RulesConfig;

/// Sum of filled boxes over all tracks, each track clamped at
/// max_stress_per_track.
auto total_stress_for_fallout(const Entity& entity) -> int;

auto fallout_severity(int total_stress) -> Severity;

/// Boxes cleared when fallout of the given severity is taken.
auto stress_clear_amount(Severity severity) -> int;

/// Returns a value in [0, 1).
using RandomSource = std::function<double()>;

/// A RandomSource backed by a seeded std::mt19937_64.
auto make_random_source(std::uint64_t seed) -> RandomSource;

struct FalloutResult {
    Fallout fallout;
    int roll{0};      ///< The d10 result.
    int total{0};     ///< Total stress the roll was made against.
    int cleared{0};   ///< Boxes cleared.
};

/// Clear up to amount boxes, starting with first and continuing through
/// the other tracks in canonical order.
/// @return The number of boxes actually cleared.
auto clear_stress(Entity& entity, StressTrack first, int amount) -> int;

/// Roll for fallout after stress was taken on track.
///
/// The roll is `floor(rng() * 10) + 1` clamped to 1..10; fallout happens when it is below
/// the entity's total stress. The fallout is appended to the entity and,
/// when the rules say so, stress is cleared starting with track.
/// @return What happened, or nullopt if no fallout was taken.
auto maybe_trigger_fallout(Entity& entity, StressTrack track, const RandomSource& rng,
                           const RulesConfig& config, std::string fallout_id, Millis now)
    -> std::optional<FalloutResult>;

}  // namespace campaign_sync
