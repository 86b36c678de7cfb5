#include <campaign-sync/sync_controller.hpp>
#include <campaign-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <utility>

namespace campaign_sync {

namespace {

auto kind_label(EntityKind kind) -> std::string_view {
    switch (kind) {
        case EntityKind::pc:           return "PC";
        case EntityKind::npc:          return "NPC";
        case EntityKind::organisation: return "Organisation";
    }
    return "Entity";
}

auto state_for(SaveOutcome outcome) -> SyncState {
    switch (outcome) {
        case SaveOutcome::saved:            return SyncState::saved;
        case SaveOutcome::offline:          return SyncState::offline;
        case SaveOutcome::conflict_blocked: return SyncState::conflict_blocked;
        case SaveOutcome::write_failed:     return SyncState::write_failed;
    }
    return SyncState::idle;
}

auto conflict_indicator() -> Indicator {
    return Indicator{
        .kind = IndicatorKind::conflict,
        .sticky = true,
        .message = "Campaign changed elsewhere. Your edits are queued until you reload or overwrite.",
    };
}

auto offline_indicator() -> Indicator {
    return Indicator{.kind = IndicatorKind::offline_queued, .message = "Offline. Changes queued."};
}

auto saved_indicator() -> Indicator {
    return Indicator{.kind = IndicatorKind::saved, .message = "Saved"};
}

auto write_failed_indicator(const Failure& failure) -> Indicator {
    return Indicator{
        .kind = IndicatorKind::write_failed,
        .message = "Could not save (" + failure.error().message + "). Retry when ready.",
    };
}

/// Split a section scope id `<entity>#<section>`.
auto parse_section_scope(const Scope& scope) -> std::optional<std::pair<std::string, SectionName>> {
    auto hash = scope.id.rfind('#');
    if (hash == std::string::npos) return std::nullopt;
    auto section = parse_section_name(std::string_view{scope.id}.substr(hash + 1));
    if (!section) return std::nullopt;
    return std::pair{scope.id.substr(0, hash), *section};
}

void apply_snapshot(Campaign& camp, const Snapshot& snapshot) {
    if (const auto* whole = std::get_if<Campaign>(&snapshot)) {
        camp = SnapshotCodec::clone(*whole);
        return;
    }
    if (const auto* rel = std::get_if<RelationshipSnapshot>(&snapshot)) {
        if (rel->relationship) {
            camp.relationships.insert_or_assign(rel->relationship_id, *rel->relationship);
        } else {
            camp.relationships.erase(rel->relationship_id);
        }
        return;
    }
    const auto& sec = std::get<SectionSnapshot>(snapshot);
    if (auto* entity = camp.find_entity(sec.entity_id)) {
        entity->section(sec.section) = sec.items;
    }
}

}  // namespace

// -- Construction -------------------------------------------------------------

SyncController::SyncController(const SyncConfig& config, DurableMedium& medium,
                               std::unique_ptr<Transport> local_transport)
    : SyncController{config, medium, std::move(local_transport), RevisionClock{},
                     make_random_source(std::random_device{}())} {}

SyncController::SyncController(const SyncConfig& config, DurableMedium& medium,
                               std::unique_ptr<Transport> local_transport,
                               RevisionClock clock, RandomSource random)
    : config_{config},
      session_{
          .user = config.user,
          .client_id = ClientId::random(),
          .actor_label = config.actor_label,
          .actor_role = config.actor_role,
      },
      clock_{std::move(clock)},
      random_{std::move(random)},
      store_{medium, clock_, SnapshotCodec{config.deflate_threshold}},
      conflicts_{session_, store_},
      queue_{session_, store_, conflicts_, config.queue_capacity},
      notifier_{session_, std::move(local_transport), [this] { return clock_.now(); }},
      history_{config.history, [this] { return clock_.now(); }} {
    notifier_.subscribe([this](const Event& event) { conflicts_.observe(event.revision); });
    conflicts_.on_change([this](const ConflictState&) { refresh_conflict_indicator(); });
}

void SyncController::open() {
    history_.clear();
    if (auto stored = store_.get(session_.user)) {
        session_.campaigns = std::move(stored->campaigns);
        session_.known_revision = std::move(stored->revision);
        if (!session_.campaigns.active() && !session_.campaigns.campaigns.empty()) {
            session_.campaigns.active_campaign_id = session_.campaigns.campaigns.begin()->first;
        }
        SPDLOG_INFO("opened {} campaign(s) for '{}' at revision {}",
                    session_.campaigns.campaigns.size(), session_.user, session_.known_revision.value);
    } else {
        session_.campaigns = make_default_campaign_set(generate_id("campaign"));
        session_.known_revision = RevisionToken{};
        SPDLOG_INFO("no campaigns stored for '{}', starting a new one", session_.user);
    }

    queue_.restore();
    state_ = SyncState::idle;
    indicator_ = queue_.empty() ? Indicator{} : offline_indicator();
}

// -- Mutations ----------------------------------------------------------------

auto SyncController::mutate_campaign(std::string label, const CampaignMutation& fn) -> SaveOutcome {
    const auto& camp = active_campaign();
    auto scope = campaign_scope(camp.id);
    return run(scope, std::move(label), SnapshotCodec::clone(camp), fn);
}

auto SyncController::mutate_relationship(std::string_view relationship_id, std::string label,
                                         const RelationshipMutation& fn) -> SaveOutcome {
    const auto& camp = active_campaign();
    if (!camp.find_relationship(relationship_id)) {
        throw Failure{ErrorKind::not_found,
                      "relationship '" + std::string{relationship_id} + "' does not exist"};
    }
    auto scope = relationship_scope(relationship_id);
    return run(scope, std::move(label), capture(scope, camp), [&](Campaign& c) {
        fn(*c.find_relationship(relationship_id));
    });
}

auto SyncController::mutate_section(std::string_view entity_id, SectionName section,
                                    std::string label, const SectionMutation& fn) -> SaveOutcome {
    const auto& camp = active_campaign();
    if (!camp.find_entity(entity_id)) {
        throw Failure{ErrorKind::not_found, "entity '" + std::string{entity_id} + "' does not exist"};
    }
    auto scope = section_scope(entity_id, section);
    return run(scope, std::move(label), capture(scope, camp), [&](Campaign& c) {
        fn(c.find_entity(entity_id)->section(section));
    });
}

auto SyncController::mutate_untracked(const CampaignMutation& fn) -> SaveOutcome {
    const auto& camp = active_campaign();
    auto scope = campaign_scope(camp.id);
    return run(scope, {}, SnapshotCodec::clone(camp), fn, false);
}

auto SyncController::add_entity(Entity entity) -> SaveOutcome {
    if (entity.id.empty()) entity.id = generate_id(to_string_view(entity.kind));
    if (active_campaign().find_entity(entity.id)) {
        throw std::invalid_argument{"entity '" + entity.id + "' already exists"};
    }

    auto label = "Created " + std::string{kind_label(entity.kind)};
    return mutate_campaign(std::move(label), [&](Campaign& c) {
        auto id = entity.id;
        c.entities.emplace(std::move(id), std::move(entity));
    });
}

auto SyncController::delete_entity(std::string_view entity_id) -> SaveOutcome {
    const auto* entity = active_campaign().find_entity(entity_id);
    if (!entity) {
        throw Failure{ErrorKind::not_found, "entity '" + std::string{entity_id} + "' does not exist"};
    }

    auto id = entity->id;
    auto label = "Deleted " + std::string{kind_label(entity->kind)};
    return mutate_campaign(std::move(label), [&](Campaign& c) {
        std::erase_if(c.relationships, [&](const auto& item) {
            return item.second.from_id == id || item.second.to_id == id;
        });
        c.entities.erase(id);
    });
}

auto SyncController::add_relationship(Relationship relationship) -> SaveOutcome {
    const auto& camp = active_campaign();
    for (const auto& endpoint : {relationship.from_id, relationship.to_id}) {
        if (!camp.find_entity(endpoint)) {
            throw Failure{ErrorKind::not_found, "entity '" + endpoint + "' does not exist"};
        }
    }
    if (relationship.id.empty()) relationship.id = generate_id("rel");
    if (camp.find_relationship(relationship.id)) {
        throw std::invalid_argument{"relationship '" + relationship.id + "' already exists"};
    }

    auto scope = relationship_scope(relationship.id);
    auto before = RelationshipSnapshot{.relationship_id = relationship.id, .relationship = std::nullopt};
    return run(scope, "Added relationship", std::move(before), [&](Campaign& c) {
        auto id = relationship.id;
        c.relationships.emplace(std::move(id), std::move(relationship));
    });
}

auto SyncController::delete_relationship(std::string_view relationship_id) -> SaveOutcome {
    if (!active_campaign().find_relationship(relationship_id)) {
        throw Failure{ErrorKind::not_found,
                      "relationship '" + std::string{relationship_id} + "' does not exist"};
    }
    auto id = std::string{relationship_id};
    return mutate_campaign("Deleted relationship", [&](Campaign& c) { c.relationships.erase(id); });
}

auto SyncController::apply_stress(std::string_view entity_id, StressTrack track, int amount)
    -> StressOutcome {
    const auto& camp = active_campaign();
    const auto* entity = camp.find_entity(entity_id);
    if (!entity) {
        throw Failure{ErrorKind::not_found, "entity '" + std::string{entity_id} + "' does not exist"};
    }

    const auto rules = rules_config(camp.settings);
    const auto name = entity->name;
    auto result = StressOutcome{};
    auto label = "Stress on " + name;

    result.save = mutate_campaign(std::move(label), [&](Campaign& c) {
        auto& target = *c.find_entity(entity_id);
        auto& boxes = target.stress[track];
        const auto step = std::clamp(amount, -max_stress_per_track, max_stress_per_track);
        boxes = std::clamp(boxes + step, 0, max_stress_per_track);
        if (amount <= 0) return;

        result.fallout = maybe_trigger_fallout(target, track, random_, rules,
                                               generate_id("fallout"), clock_.now());
        if (result.fallout) {
            c.log.push_back(LogEntry{
                .at = clock_.now(),
                .text = name + " takes " + std::string{to_string_view(result.fallout->fallout.severity)} +
                        " " + std::string{to_string_view(track)} + " fallout (rolled " +
                        std::to_string(result.fallout->roll) + " against " +
                        std::to_string(result.fallout->total) + ")",
            });
        }
    });
    return result;
}

// -- History ------------------------------------------------------------------

auto SyncController::undo(const Scope& scope) -> std::optional<SaveOutcome> {
    return restore_entry(scope, false);
}

auto SyncController::redo(const Scope& scope) -> std::optional<SaveOutcome> {
    return restore_entry(scope, true);
}

auto SyncController::restore_entry(const Scope& scope, bool forward) -> std::optional<SaveOutcome> {
    auto& camp = active_campaign();
    // Campaign entries of another campaign cannot be checked against the live one.
    if (scope.kind == ScopeKind::campaign && scope.id != camp.id) return std::nullopt;

    auto current = capture(scope, camp);
    auto entry = forward ? history_.redo(scope, std::move(current), applicable(camp))
                         : history_.undo(scope, std::move(current), applicable(camp));
    if (!entry) return std::nullopt;

    {
        auto guard = history_.begin_restore();
        apply_snapshot(camp, entry->snapshot);
    }
    SPDLOG_INFO("{} '{}' on {} scope '{}'", forward ? "redo" : "undo", entry->label,
                to_string_view(scope.kind), scope.id);
    return persist();
}

// -- Sync ---------------------------------------------------------------------

auto SyncController::set_online(bool online) -> std::optional<SaveOutcome> {
    const auto was_online = session_.online;
    session_.online = online;
    if (was_online == online) return std::nullopt;

    SPDLOG_INFO("'{}' is now {}", session_.user, online ? "online" : "offline");
    if (online && !queue_.empty()) return flush_pending();
    return std::nullopt;
}

auto SyncController::retry() -> SaveOutcome {
    if (!queue_.empty()) return flush_pending();
    return persist();
}

auto SyncController::check_consistency() -> bool {
    return conflicts_.check();
}

void SyncController::on_storage_change(std::string_view key) {
    if (key == user_key(session_.user, keys::revision)) {
        conflicts_.check();
    }
}

auto SyncController::resolve(ResolutionKind kind) -> SaveOutcome {
    switch (kind) {
        case ResolutionKind::dismiss:
            conflicts_.resolve(kind);
            return conflicts_.active() ? SaveOutcome::conflict_blocked : SaveOutcome::saved;

        case ResolutionKind::reload_latest: {
            conflicts_.resolve(kind);
            transition(SyncState::saving);
            // Entries captured against the replaced state no longer apply.
            history_.clear();
            auto dropped = queue_.clear_kind(OperationKind::save_campaigns);
            if (dropped != 0) SPDLOG_WARN("discarded {} queued write(s) in favour of the durable state", dropped);
            finish(SaveOutcome::saved, Indicator{.kind = IndicatorKind::saved, .message = "Reloaded latest"});
            return SaveOutcome::saved;
        }

        case ResolutionKind::force_overwrite: {
            transition(SyncState::saving);
            auto token = RevisionToken{};
            try {
                token = conflicts_.resolve(kind).value_or(RevisionToken{});
            } catch (const Failure& e) {
                SPDLOG_ERROR("overwrite failed: {}", e.what());
                finish(SaveOutcome::write_failed, write_failed_indicator(e));
                return SaveOutcome::write_failed;
            }
            queue_.clear_kind(OperationKind::save_campaigns);
            announce(token);
            finish(SaveOutcome::saved, saved_indicator());
            return SaveOutcome::saved;
        }
    }
    return SaveOutcome::conflict_blocked;
}

auto SyncController::discard_pending(const std::vector<std::string>& ids) -> std::size_t {
    auto removed = queue_.discard(ids);
    if (removed != 0 && queue_.empty() && indicator_.kind == IndicatorKind::offline_queued) {
        indicator_ = Indicator{};
        transition(state_);
    }
    return removed;
}

auto SyncController::connect_remote(RemoteConnector& connector) -> bool {
    if (!config_.remote) {
        SPDLOG_WARN("no remote transport configured for '{}'", session_.user);
        return false;
    }
    return notifier_.enable_remote(connector, *config_.remote);
}

void SyncController::on_state(StateListener listener) {
    listeners_.push_back(std::move(listener));
}

// -- Internals ----------------------------------------------------------------

auto SyncController::active_campaign() -> Campaign& {
    auto* camp = session_.campaigns.active();
    if (!camp) throw Failure{ErrorKind::not_found, "no active campaign"};
    return *camp;
}

auto SyncController::generate_id(std::string_view prefix) -> std::string {
    auto id = std::string{prefix};
    id += '-';
    id += std::to_string(clock_.now());
    id += '-';
    id += session_.client_id.to_hex().substr(0, 6);
    id += std::to_string(++id_sequence_);
    return id;
}

auto SyncController::capture(const Scope& scope, const Campaign& camp) const -> Snapshot {
    switch (scope.kind) {
        case ScopeKind::campaign:
            return SnapshotCodec::clone(camp);

        case ScopeKind::relationship: {
            auto snapshot = RelationshipSnapshot{.relationship_id = scope.id, .relationship = std::nullopt};
            if (const auto* rel = camp.find_relationship(scope.id)) snapshot.relationship = *rel;
            return snapshot;
        }

        case ScopeKind::section: {
            auto parsed = parse_section_scope(scope);
            if (!parsed) {
                throw Failure{ErrorKind::not_found, "'" + scope.id + "' is not a section scope"};
            }
            auto snapshot = SectionSnapshot{.entity_id = parsed->first, .section = parsed->second, .items = {}};
            if (const auto* entity = camp.find_entity(parsed->first)) {
                snapshot.items = entity->section(parsed->second);
            }
            return snapshot;
        }
    }
    return SnapshotCodec::clone(camp);
}

auto SyncController::applicable(const Campaign& camp) const -> HistoryManager::Applicable {
    return [&camp](const HistoryEntry& entry) {
        if (const auto* rel = std::get_if<RelationshipSnapshot>(&entry.snapshot)) {
            return !rel->relationship ||
                   (camp.find_entity(rel->relationship->from_id) && camp.find_entity(rel->relationship->to_id));
        }
        if (const auto* sec = std::get_if<SectionSnapshot>(&entry.snapshot)) {
            return camp.find_entity(sec->entity_id) != nullptr;
        }
        return true;
    };
}

auto SyncController::run(const Scope& scope, std::string label, Snapshot before,
                         const CampaignMutation& fn, bool tracked) -> SaveOutcome {
    auto& camp = active_campaign();
    try {
        fn(camp);
    } catch (...) {
        SPDLOG_WARN("mutation on {} scope '{}' threw, rolling back", to_string_view(scope.kind), scope.id);
        apply_snapshot(camp, before);
        throw;
    }

    if (tracked) {
        SPDLOG_DEBUG("recorded '{}' on {} scope '{}'", label, to_string_view(scope.kind), scope.id);
        history_.push_undo(scope, std::move(label), std::move(before));
    }
    return persist();
}

auto SyncController::persist() -> SaveOutcome {
    transition(SyncState::saving);

    if (conflicts_.active()) return block(SaveOutcome::conflict_blocked);
    if (!session_.online) return block(SaveOutcome::offline);
    if (conflicts_.check()) return block(SaveOutcome::conflict_blocked);

    auto token = RevisionToken{};
    try {
        token = store_.put(session_.user, session_.campaigns);
    } catch (const Failure& e) {
        SPDLOG_ERROR("save for '{}' failed: {}", session_.user, e.what());
        // retry() commits the newest queued write, so it has to carry this state.
        if (!queue_.empty()) queue_live_state();
        finish(SaveOutcome::write_failed, write_failed_indicator(e));
        return SaveOutcome::write_failed;
    }

    conflicts_.acknowledge(token);
    if (!queue_.empty()) queue_.clear_kind(OperationKind::save_campaigns);
    announce(token);
    finish(SaveOutcome::saved, saved_indicator());
    return SaveOutcome::saved;
}

auto SyncController::flush_pending() -> SaveOutcome {
    transition(SyncState::saving);

    if (!session_.online) {
        finish(SaveOutcome::offline, offline_indicator());
        return SaveOutcome::offline;
    }
    if (conflicts_.active()) {
        finish(SaveOutcome::conflict_blocked, conflict_indicator());
        return SaveOutcome::conflict_blocked;
    }

    try {
        if (queue_.flush() != 0) announce(session_.known_revision);
    } catch (const Failure& e) {
        if (e.kind() == ErrorKind::queue_flush_rejected) {
            finish(SaveOutcome::conflict_blocked, conflict_indicator());
            return SaveOutcome::conflict_blocked;
        }
        SPDLOG_ERROR("flushing queued writes failed: {}", e.what());
        finish(SaveOutcome::write_failed, write_failed_indicator(e));
        return SaveOutcome::write_failed;
    }

    finish(SaveOutcome::saved, saved_indicator());
    return SaveOutcome::saved;
}

auto SyncController::block(SaveOutcome outcome) -> SaveOutcome {
    if (outcome == SaveOutcome::conflict_blocked) conflicts_.record_local_attempt();
    queue_live_state();
    finish(outcome, outcome == SaveOutcome::conflict_blocked ? conflict_indicator() : offline_indicator());
    return outcome;
}

void SyncController::queue_live_state() {
    queue_.enqueue(PendingOperation{
        .id = generate_id("op"),
        .created_at = clock_.now(),
        .kind = OperationKind::save_campaigns,
        .base_revision = session_.known_revision,
        .campaign_id = session_.campaigns.active_campaign_id,
        .payload = SnapshotCodec::clone(session_.campaigns),
    });
}

void SyncController::announce(const RevisionToken& revision) {
    notifier_.announce(Event{
        .kind = EventKind::write_committed,
        .revision = revision,
        .campaign_id = session_.campaigns.active_campaign_id,
        .actor_label = session_.actor_label,
        .actor_role = session_.actor_role,
    });
}

void SyncController::transition(SyncState state) {
    state_ = state;
    for (const auto& listener : listeners_) {
        listener(state_, indicator_);
    }
}

void SyncController::finish(SaveOutcome outcome, Indicator indicator) {
    // A visible conflict outranks every transient indicator.
    if (conflicts_.visible() && outcome != SaveOutcome::conflict_blocked) {
        indicator_ = conflict_indicator();
    } else {
        indicator_ = std::move(indicator);
    }
    transition(state_for(outcome));
    transition(SyncState::idle);
}

void SyncController::refresh_conflict_indicator() {
    if (conflicts_.visible()) {
        indicator_ = conflict_indicator();
    } else if (indicator_.kind == IndicatorKind::conflict) {
        indicator_ = Indicator{};
    } else {
        return;
    }
    transition(state_);
}

}  // namespace campaign_sync
