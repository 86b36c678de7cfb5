/// @file campaign.hpp
/// @brief The campaign aggregate: Entity, Relationship, Settings, Campaign, CampaignSet.

#pragma once

#include <campaign-sync/types.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace campaign_sync {

/// The kinds of entity a campaign tracks.
enum class EntityKind : std::uint8_t {
    pc,            ///< A player character.
    npc,           ///< A non-player character.
    organisation,  ///< A faction, guild or other group.
};

/// The five stress tracks.
enum class StressTrack : std::uint8_t {
    blood,
    mind,
    silver,
    shadow,
    reputation,
};

/// All stress tracks in canonical order.
inline constexpr std::array<StressTrack, 5> all_stress_tracks = {
    StressTrack::blood, StressTrack::mind, StressTrack::silver,
    StressTrack::shadow, StressTrack::reputation,
};

/// Fallout severity levels.
enum class Severity : std::uint8_t {
    minor,
    moderate,
    severe,
};

/// The array-valued sections of an entity that get their own undo history.
enum class SectionName : std::uint8_t {
    tasks,
    inventory,
    bonds,
};

constexpr auto to_string_view(EntityKind kind) noexcept -> std::string_view {
    switch (kind) {
        case EntityKind::pc:           return "pc";
        case EntityKind::npc:          return "npc";
        case EntityKind::organisation: return "organisation";
    }
    return "unknown";
}

constexpr auto to_string_view(StressTrack track) noexcept -> std::string_view {
    switch (track) {
        case StressTrack::blood:      return "blood";
        case StressTrack::mind:       return "mind";
        case StressTrack::silver:     return "silver";
        case StressTrack::shadow:     return "shadow";
        case StressTrack::reputation: return "reputation";
    }
    return "unknown";
}

constexpr auto to_string_view(Severity severity) noexcept -> std::string_view {
    switch (severity) {
        case Severity::minor:    return "Minor";
        case Severity::moderate: return "Moderate";
        case Severity::severe:   return "Severe";
    }
    return "unknown";
}

constexpr auto to_string_view(SectionName section) noexcept -> std::string_view {
    switch (section) {
        case SectionName::tasks:     return "tasks";
        case SectionName::inventory: return "inventory";
        case SectionName::bonds:     return "bonds";
    }
    return "unknown";
}

/// Parse helpers; nullopt for unknown names.
auto parse_entity_kind(std::string_view s) -> std::optional<EntityKind>;
auto parse_stress_track(std::string_view s) -> std::optional<StressTrack>;
auto parse_severity(std::string_view s) -> std::optional<Severity>;
auto parse_section_name(std::string_view s) -> std::optional<SectionName>;

/// One line in an entity section (a task, an item, a bond).
struct SectionItem {
    std::string id;
    std::string text;
    bool done{false};

    auto operator==(const SectionItem&) const -> bool = default;
};

using Section = std::vector<SectionItem>;

/// A consequence produced when stress overflows.
struct Fallout {
    std::string id;
    StressTrack track{StressTrack::blood};
    Severity severity{Severity::minor};
    Millis created_at{0};

    auto operator==(const Fallout&) const -> bool = default;
};

/// A character, NPC or organisation.
struct Entity {
    std::string id;
    EntityKind kind{EntityKind::npc};
    std::string name;
    std::map<std::string, std::string> fields;  ///< Free-form sheet fields.
    Section tasks;
    Section inventory;
    Section bonds;
    std::map<StressTrack, int> stress;          ///< Filled boxes per track.
    std::vector<Fallout> fallout;

    /// Access a named section.
    auto section(SectionName name) -> Section&;
    auto section(SectionName name) const -> const Section&;

    /// Filled boxes on a track (0 when the track was never touched).
    auto stress_on(StressTrack track) const -> int;

    auto operator==(const Entity&) const -> bool = default;
};

/// A directed link between two entities.
struct Relationship {
    std::string id;
    std::string from_id;
    std::string to_id;
    std::string label;
    std::string notes;
    int strength{0};

    auto operator==(const Relationship&) const -> bool = default;
};

/// Per-rule overrides used by the `Custom` rules profile.
struct CustomRules {
    std::optional<bool> difficulty_downgrades;
    std::optional<bool> fallout_check_on_stress;
    std::optional<bool> clear_stress_on_fallout;

    auto operator==(const CustomRules&) const -> bool = default;
};

/// Scalar campaign settings.
struct Settings {
    std::string rules_profile{"Core"};  ///< "Core", "Quickstart" or "Custom".
    CustomRules custom_rules;

    auto operator==(const Settings&) const -> bool = default;
};

/// A line in the session log.
struct LogEntry {
    Millis at{0};
    std::string text;

    auto operator==(const LogEntry&) const -> bool = default;
};

/// The aggregate root for one game.
struct Campaign {
    std::string id;
    std::string name;
    std::map<std::string, Entity> entities;
    std::map<std::string, Relationship> relationships;
    Settings settings;
    std::vector<LogEntry> log;

    auto find_entity(std::string_view entity_id) -> Entity*;
    auto find_entity(std::string_view entity_id) const -> const Entity*;
    auto find_relationship(std::string_view relationship_id) -> Relationship*;
    auto find_relationship(std::string_view relationship_id) const -> const Relationship*;

    auto operator==(const Campaign&) const -> bool = default;
};

/// Everything one user has stored: the unit DurableStore reads and writes.
struct CampaignSet {
    std::map<std::string, Campaign> campaigns;
    std::string active_campaign_id;

    /// The active campaign, or nullptr when none is selected.
    auto active() -> Campaign*;
    auto active() const -> const Campaign*;

    auto operator==(const CampaignSet&) const -> bool = default;
};

/// A fresh campaign with the given id and name and default settings.
auto make_campaign(std::string id, std::string name) -> Campaign;

/// A set holding a single new campaign, marked active.
auto make_default_campaign_set(std::string campaign_id) -> CampaignSet;

}  // namespace campaign_sync
