#include <campaign-sync/campaign.hpp>

#include <utility>

namespace campaign_sync {

auto parse_entity_kind(std::string_view s) -> std::optional<EntityKind> {
    if (s == "pc") return EntityKind::pc;
    if (s == "npc") return EntityKind::npc;
    if (s == "organisation") return EntityKind::organisation;
    return std::nullopt;
}

auto parse_stress_track(std::string_view s) -> std::optional<StressTrack> {
    for (auto track : all_stress_tracks) {
        if (to_string_view(track) == s) return track;
    }
    return std::nullopt;
}

auto parse_severity(std::string_view s) -> std::optional<Severity> {
    if (s == "Minor") return Severity::minor;
    if (s == "Moderate") return Severity::moderate;
    if (s == "Severe") return Severity::severe;
    return std::nullopt;
}

auto parse_section_name(std::string_view s) -> std::optional<SectionName> {
    if (s == "tasks") return SectionName::tasks;
    if (s == "inventory") return SectionName::inventory;
    if (s == "bonds") return SectionName::bonds;
    return std::nullopt;
}

// -- Entity -------------------------------------------------------------------

auto Entity::section(SectionName name) -> Section& {
    switch (name) {
        case SectionName::tasks:     return tasks;
        case SectionName::inventory: return inventory;
        case SectionName::bonds:     return bonds;
    }
    return tasks;
}

auto Entity::section(SectionName name) const -> const Section& {
    switch (name) {
        case SectionName::tasks:     return tasks;
        case SectionName::inventory: return inventory;
        case SectionName::bonds:     return bonds;
    }
    return tasks;
}

auto Entity::stress_on(StressTrack track) const -> int {
    auto it = stress.find(track);
    return it != stress.end() ? it->second : 0;
}

// -- Campaign -----------------------------------------------------------------

auto Campaign::find_entity(std::string_view entity_id) -> Entity* {
    auto it = entities.find(std::string{entity_id});
    return it != entities.end() ? &it->second : nullptr;
}

auto Campaign::find_entity(std::string_view entity_id) const -> const Entity* {
    auto it = entities.find(std::string{entity_id});
    return it != entities.end() ? &it->second : nullptr;
}

auto Campaign::find_relationship(std::string_view relationship_id) -> Relationship* {
    auto it = relationships.find(std::string{relationship_id});
    return it != relationships.end() ? &it->second : nullptr;
}

auto Campaign::find_relationship(std::string_view relationship_id) const -> const Relationship* {
    auto it = relationships.find(std::string{relationship_id});
    return it != relationships.end() ? &it->second : nullptr;
}

// -- CampaignSet --------------------------------------------------------------

auto CampaignSet::active() -> Campaign* {
    auto it = campaigns.find(active_campaign_id);
    return it != campaigns.end() ? &it->second : nullptr;
}

auto CampaignSet::active() const -> const Campaign* {
    auto it = campaigns.find(active_campaign_id);
    return it != campaigns.end() ? &it->second : nullptr;
}

auto make_campaign(std::string id, std::string name) -> Campaign {
    auto campaign = Campaign{};
    campaign.id = std::move(id);
    campaign.name = std::move(name);
    return campaign;
}

auto make_default_campaign_set(std::string campaign_id) -> CampaignSet {
    auto set = CampaignSet{};
    set.active_campaign_id = campaign_id;
    set.campaigns.emplace(campaign_id, make_campaign(campaign_id, "New Campaign"));
    return set;
}

}  // namespace campaign_sync
