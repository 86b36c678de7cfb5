/// @file sync_controller.hpp
/// @brief SyncController: the save/undo/conflict state machine of one context.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/config.hpp>
#include <campaign-sync/conflict_monitor.hpp>
#include <campaign-sync/durable_medium.hpp>
#include <campaign-sync/durable_store.hpp>
#include <campaign-sync/history.hpp>
#include <campaign-sync/notifier.hpp>
#include <campaign-sync/offline_queue.hpp>
#include <campaign-sync/revision_clock.hpp>
#include <campaign-sync/rules.hpp>
#include <campaign-sync/session.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace campaign_sync {

/// States of the save state machine. Every save passes through
/// `saving` and one outcome state before returning to `idle`.
enum class SyncState : std::uint8_t {
    idle,
    saving,
    saved,
    offline,
    conflict_blocked,
    write_failed,
};

constexpr auto to_string_view(SyncState state) noexcept -> std::string_view {
    switch (state) {
        case SyncState::idle:             return "idle";
        case SyncState::saving:           return "saving";
        case SyncState::saved:            return "saved";
        case SyncState::offline:          return "offline";
        case SyncState::conflict_blocked: return "conflict_blocked";
        case SyncState::write_failed:     return "write_failed";
    }
    return "unknown";
}

/// How a save attempt ended.
enum class SaveOutcome : std::uint8_t {
    saved,             ///< Committed and announced.
    offline,           ///< Queued until connectivity returns.
    conflict_blocked,  ///< Queued; a conflict needs resolving first.
    write_failed,      ///< Not committed; retry() may succeed later.
};

constexpr auto to_string_view(SaveOutcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case SaveOutcome::saved:            return "saved";
        case SaveOutcome::offline:          return "offline";
        case SaveOutcome::conflict_blocked: return "conflict_blocked";
        case SaveOutcome::write_failed:     return "write_failed";
    }
    return "unknown";
}

enum class IndicatorKind : std::uint8_t {
    none,
    saved,
    offline_queued,
    conflict,
    write_failed,
};

constexpr auto to_string_view(IndicatorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case IndicatorKind::none:           return "none";
        case IndicatorKind::saved:          return "saved";
        case IndicatorKind::offline_queued: return "offline_queued";
        case IndicatorKind::conflict:       return "conflict";
        case IndicatorKind::write_failed:   return "write_failed";
    }
    return "unknown";
}

/// What the UI should show about persistence. Sticky indicators stay
/// until the condition behind them is resolved.
struct Indicator {
    IndicatorKind kind{IndicatorKind::none};
    bool sticky{false};
    std::string message;

    auto operator==(const Indicator&) const -> bool = default;
};

/// Result of apply_stress().
struct StressOutcome {
    SaveOutcome save{SaveOutcome::saved};
    std::optional<FalloutResult> fallout;
};

/// Drives every mutation of one execution context's campaigns: history
/// capture, commit or queueing, conflict blocking and announcement.
///
/// All work happens synchronously on the caller's thread. Transitions are
/// caused by calls on this object and by notifications arriving through
/// the Notifier; there is no timer.
///
/// @code
/// auto storage = MemoryStorage{};
/// auto bus = LocalBus{};
/// auto medium = storage.open();
/// auto ctl = SyncController{SyncConfig{}, *medium, bus.attach()};
/// ctl.open();
/// ctl.add_entity(Entity{.id = "pc-1", .kind = EntityKind::pc, .name = "Ash"});
/// ctl.undo(campaign_scope(ctl.session().campaigns.active_campaign_id));
/// @endcode
class SyncController {
public:
    using StateListener = std::function<void(SyncState, const Indicator&)>;
    using CampaignMutation = std::function<void(Campaign&)>;
    using RelationshipMutation = std::function<void(Relationship&)>;
    using SectionMutation = std::function<void(Section&)>;

    SyncController(const SyncConfig& config, DurableMedium& medium,
                   std::unique_ptr<Transport> local_transport);

    /// Controller with an explicit clock and random source (deterministic in tests).
    SyncController(const SyncConfig& config, DurableMedium& medium,
                   std::unique_ptr<Transport> local_transport,
                   RevisionClock clock, RandomSource random);

    SyncController(const SyncController&) = delete;
    auto operator=(const SyncController&) -> SyncController& = delete;

    // -- Lifecycle ------------------------------------------------------------

    /// Load the user's campaigns and restore the pending queue.
    ///
    /// A user with no stored campaigns gets a fresh default campaign,
    /// which is not committed until the first mutation.
    /// @throws Failure (snapshot_corrupt) if the stored campaigns and their
    ///   backup are both unreadable.
    void open();

    // -- Mutations ------------------------------------------------------------

    /// Mutate the active campaign, recording a whole-campaign undo entry.
    ///
    /// If fn throws, the campaign is restored, no history is recorded and
    /// the exception propagates.
    /// @throws Failure (not_found) if there is no active campaign.
    auto mutate_campaign(std::string label, const CampaignMutation& fn) -> SaveOutcome;

    /// Mutate one existing relationship, recording an undo entry for it alone.
    /// @throws Failure (not_found) if the relationship does not exist.
    auto mutate_relationship(std::string_view relationship_id, std::string label,
                             const RelationshipMutation& fn) -> SaveOutcome;

    /// Mutate one section of one entity, recording an undo entry for it alone.
    /// @throws Failure (not_found) if the entity does not exist.
    auto mutate_section(std::string_view entity_id, SectionName section, std::string label,
                        const SectionMutation& fn) -> SaveOutcome;

    /// Mutate the active campaign without recording history.
    auto mutate_untracked(const CampaignMutation& fn) -> SaveOutcome;

    /// Add an entity; an empty id is replaced by a generated one.
    auto add_entity(Entity entity) -> SaveOutcome;

    /// Delete an entity and the relationships that reference it.
    /// @throws Failure (not_found) if the entity does not exist.
    auto delete_entity(std::string_view entity_id) -> SaveOutcome;

    /// Add a relationship between two existing entities.
    /// @throws Failure (not_found) if either endpoint does not exist.
    auto add_relationship(Relationship relationship) -> SaveOutcome;

    /// @throws Failure (not_found) if the relationship does not exist.
    auto delete_relationship(std::string_view relationship_id) -> SaveOutcome;

    /// Fill amount boxes on a stress track and roll for fallout under the
    /// campaign's rules. Stress and fallout are one undoable edit.
    /// @throws Failure (not_found) if the entity does not exist.
    auto apply_stress(std::string_view entity_id, StressTrack track, int amount) -> StressOutcome;

    // -- History --------------------------------------------------------------

    /// Restore the newest undo entry of scope and commit the result.
    /// @return nullopt if scope has nothing to undo.
    auto undo(const Scope& scope) -> std::optional<SaveOutcome>;

    /// Restore the newest redo entry of scope and commit the result.
    /// @return nullopt if scope has nothing to redo.
    auto redo(const Scope& scope) -> std::optional<SaveOutcome>;

    // -- Sync -----------------------------------------------------------------

    /// Record a connectivity change. Coming back online flushes the queue.
    /// @return The flush outcome, or nullopt if nothing was flushed.
    auto set_online(bool online) -> std::optional<SaveOutcome>;

    /// Retry persistence: flush the queue if anything is queued, otherwise
    /// commit the live state.
    auto retry() -> SaveOutcome;

    /// Compare the durable revision with the known one.
    /// @return Whether a conflict is active afterwards.
    auto check_consistency() -> bool;

    /// Host hook for durable-medium change events.
    void on_storage_change(std::string_view key);

    /// Settle an active conflict.
    ///
    /// reload_latest discards the queued writes and the undo history,
    /// force_overwrite commits the live state and retires the queue,
    /// dismiss only hides the indicator and reports conflict_blocked while
    /// the conflict remains.
    /// @throws Failure (snapshot_corrupt) if reload_latest cannot read the
    ///   durable state.
    auto resolve(ResolutionKind kind) -> SaveOutcome;

    /// Drop queued operations by id.
    auto discard_pending(const std::vector<std::string>& ids) -> std::size_t;

    /// Switch notifications to the configured remote transport.
    /// @return false if none is configured or it could not be opened.
    auto connect_remote(RemoteConnector& connector) -> bool;

    // -- Observation ----------------------------------------------------------

    void on_state(StateListener listener);

    auto state() const -> SyncState { return state_; }
    auto indicator() const -> const Indicator& { return indicator_; }

    auto session() -> SessionContext& { return session_; }
    auto session() const -> const SessionContext& { return session_; }
    auto history() const -> const HistoryManager& { return history_; }
    auto conflicts() const -> const ConflictMonitor& { return conflicts_; }
    auto queue() const -> const OfflineQueue& { return queue_; }
    auto notifier() -> Notifier& { return notifier_; }
    auto store() -> DurableStore& { return store_; }

private:
    auto active_campaign() -> Campaign&;
    auto generate_id(std::string_view prefix) -> std::string;
    auto capture(const Scope& scope, const Campaign& camp) const -> Snapshot;
    auto applicable(const Campaign& camp) const -> HistoryManager::Applicable;

    auto run(const Scope& scope, std::string label, Snapshot before,
             const CampaignMutation& fn, bool tracked = true) -> SaveOutcome;
    auto restore_entry(const Scope& scope, bool forward) -> std::optional<SaveOutcome>;

    auto persist() -> SaveOutcome;
    auto flush_pending() -> SaveOutcome;
    auto block(SaveOutcome outcome) -> SaveOutcome;
    void queue_live_state();
    void announce(const RevisionToken& revision);

    void transition(SyncState state);
    void finish(SaveOutcome outcome, Indicator indicator);
    void refresh_conflict_indicator();

    SyncConfig config_;
    SessionContext session_;
    RevisionClock clock_;
    RandomSource random_;
    DurableStore store_;
    ConflictMonitor conflicts_;
    OfflineQueue queue_;
    Notifier notifier_;
    HistoryManager history_;

    SyncState state_{SyncState::idle};
    Indicator indicator_;
    std::vector<StateListener> listeners_;
    std::uint64_t id_sequence_{0};
};

}  // namespace campaign_sync
