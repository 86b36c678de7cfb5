#include <campaign-sync/rules.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace campaign_sync {

auto rules_config(const Settings& settings) -> RulesConfig {
    if (settings.rules_profile == "Quickstart") {
        return RulesConfig{
            .difficulty_downgrades = true,
            .fallout_check_on_stress = false,
            .clear_stress_on_fallout = false,
        };
    }

    auto config = RulesConfig{};
    if (settings.rules_profile == "Custom") {
        const auto& custom = settings.custom_rules;
        config.difficulty_downgrades = custom.difficulty_downgrades.value_or(config.difficulty_downgrades);
        config.fallout_check_on_stress = custom.fallout_check_on_stress.value_or(config.fallout_check_on_stress);
        config.clear_stress_on_fallout = custom.clear_stress_on_fallout.value_or(config.clear_stress_on_fallout);
    }
    return config;
}

auto total_stress_for_fallout(const Entity& entity) -> int {
    auto total = 0;
    for (auto track : all_stress_tracks) {
        total += std::clamp(entity.stress_on(track), 0, max_stress_per_track);
    }
    return total;
}

auto fallout_severity(int total_stress) -> Severity {
    if (total_stress >= 9) return Severity::severe;
    if (total_stress >= 5) return Severity::moderate;
    return Severity::minor;
}

auto stress_clear_amount(Severity severity) -> int {
    switch (severity) {
        case Severity::severe:   return 7;
        case Severity::moderate: return 5;
        case Severity::minor:    return 3;
    }
    return 3;
}

auto make_random_source(std::uint64_t seed) -> RandomSource {
    auto engine = std::make_shared<std::mt19937_64>(seed);
    return [engine] {
        return std::uniform_real_distribution<double>{0.0, 1.0}(*engine);
    };
}

auto clear_stress(Entity& entity, StressTrack first, int amount) -> int {
    auto order = std::vector<StressTrack>{first};
    for (auto track : all_stress_tracks) {
        if (track != first) order.push_back(track);
    }

    auto cleared = 0;
    for (auto track : order) {
        if (cleared >= amount) break;
        auto it = entity.stress.find(track);
        if (it == entity.stress.end() || it->second <= 0) continue;
        auto take = std::min(it->second, amount - cleared);
        it->second -= take;
        cleared += take;
    }
    return cleared;
}

auto maybe_trigger_fallout(Entity& entity, StressTrack track, const RandomSource& rng,
                           const RulesConfig& config, std::string fallout_id, Millis now)
    -> std::optional<FalloutResult> {
    if (!config.fallout_check_on_stress) return std::nullopt;

    const auto total = total_stress_for_fallout(entity);
    // Clamped so a source that returns 1.0 still rolls a d10.
    const auto roll = std::clamp(static_cast<int>(std::floor(rng() * 10.0)) + 1, 1, 10);
    if (roll >= total) {
        SPDLOG_DEBUG("fallout check for '{}': rolled {} against {}, no fallout", entity.id, roll, total);
        return std::nullopt;
    }

    auto result = FalloutResult{
        .fallout = Fallout{
            .id = std::move(fallout_id),
            .track = track,
            .severity = fallout_severity(total),
            .created_at = now,
        },
        .roll = roll,
        .total = total,
    };
    entity.fallout.push_back(result.fallout);

    if (config.clear_stress_on_fallout) {
        result.cleared = clear_stress(entity, track, stress_clear_amount(result.fallout.severity));
    }
    SPDLOG_INFO("'{}' takes {} {} fallout (rolled {} against {}), {} stress cleared",
                entity.id, to_string_view(result.fallout.severity), to_string_view(track),
                roll, total, result.cleared);
    return result;
}

}  // namespace campaign_sync
