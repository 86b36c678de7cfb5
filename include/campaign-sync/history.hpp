/// @file history.hpp
/// @brief HistoryManager: scoped undo/redo stacks of campaign snapshots.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/revision_clock.hpp>
#include <campaign-sync/types.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace campaign_sync {

// -- Scopes -------------------------------------------------------------------

/// The granularity a history entry protects.
enum class ScopeKind : std::uint8_t {
    campaign,      ///< The whole campaign; used for destructive edits.
    relationship,  ///< One relationship.
    section,       ///< One array-valued section of one entity.
};

constexpr auto to_string_view(ScopeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ScopeKind::campaign:     return "campaign";
        case ScopeKind::relationship: return "relationship";
        case ScopeKind::section:      return "section";
    }
    return "unknown";
}

/// Identifies one pair of undo/redo stacks.
struct Scope {
    ScopeKind kind{ScopeKind::campaign};
    std::string id;

    auto operator<=>(const Scope&) const = default;
    auto operator==(const Scope&) const -> bool = default;
};

auto campaign_scope(std::string_view campaign_id) -> Scope;
auto relationship_scope(std::string_view relationship_id) -> Scope;

/// Section scopes are identified as `<entity id>#<section name>`.
auto section_scope(std::string_view entity_id, SectionName section) -> Scope;

// -- Snapshots ----------------------------------------------------------------

/// One relationship as it was; nullopt if it did not exist.
struct RelationshipSnapshot {
    std::string relationship_id;
    std::optional<Relationship> relationship;

    auto operator==(const RelationshipSnapshot&) const -> bool = default;
};

/// One section of one entity as it was.
struct SectionSnapshot {
    std::string entity_id;
    SectionName section{SectionName::tasks};
    Section items;

    auto operator==(const SectionSnapshot&) const -> bool = default;
};

/// The state a history entry restores. The alternative must match the
/// entry's scope kind.
using Snapshot = std::variant<Campaign, RelationshipSnapshot, SectionSnapshot>;

/// The scope kind a snapshot alternative belongs to.
auto scope_kind_of(const Snapshot& snapshot) -> ScopeKind;

/// Whether snapshot can restore scope (same kind and same target id).
auto snapshot_fits(const Scope& scope, const Snapshot& snapshot) -> bool;

struct HistoryEntry {
    std::string id;
    Millis created_at{0};
    std::string label;
    Scope target;
    Snapshot snapshot;
};

// -- HistoryStack -------------------------------------------------------------

/// A bounded stack that evicts its oldest entry when full.
class HistoryStack {
public:
    explicit HistoryStack(std::size_t capacity);

    void push(HistoryEntry entry);
    auto pop() -> std::optional<HistoryEntry>;
    auto top() const -> const HistoryEntry*;

    void clear() { entries_.clear(); }
    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }
    auto capacity() const -> std::size_t { return capacity_; }

    /// Oldest first.
    auto entries() const -> const std::deque<HistoryEntry>& { return entries_; }

private:
    std::size_t capacity_;
    std::deque<HistoryEntry> entries_;
};

// -- HistoryManager -----------------------------------------------------------

/// Per-kind stack capacities.
struct HistoryCapacities {
    std::size_t campaign{20};
    std::size_t relationship{30};
    std::size_t section{20};

    auto operator==(const HistoryCapacities&) const -> bool = default;
};

/// Undo/redo stacks keyed by scope, kept outside the campaign model so the
/// model's serialized form never carries its own history.
///
/// The caller captures snapshots and applies the snapshots handed back;
/// the manager never touches live campaign state. While a RestoreGuard is
/// alive push_undo() is ignored, so applying a restored snapshot through
/// the normal mutation path does not record a new entry.
///
/// @code
/// auto history = HistoryManager{};
/// auto scope = campaign_scope(camp.id);
/// history.push_undo(scope, "Deleted PC", camp);   // before the edit
/// delete_entity(camp, "pc-1");
/// if (auto entry = history.undo(scope, camp)) {
///     auto guard = history.begin_restore();
///     camp = std::get<Campaign>(entry->snapshot);
/// }
/// @endcode
class HistoryManager {
public:
    /// Decides whether an entry can still be applied to live state.
    using Applicable = std::function<bool(const HistoryEntry&)>;

    /// Suppresses push_undo() for its lifetime.
    class RestoreGuard {
    public:
        explicit RestoreGuard(HistoryManager& manager);
        ~RestoreGuard();

        RestoreGuard(const RestoreGuard&) = delete;
        auto operator=(const RestoreGuard&) -> RestoreGuard& = delete;

    private:
        HistoryManager& manager_;
    };

    explicit HistoryManager(HistoryCapacities capacities = {}, TimeSource now = system_time);

    /// Record the state of scope before a mutation and invalidate its redo
    /// stack.
    /// @return false if ignored because a restore is in progress.
    auto push_undo(const Scope& scope, std::string label, Snapshot snapshot) -> bool;

    /// Pop the newest usable undo entry of scope and push current onto the
    /// redo stack under the same label.
    ///
    /// Entries whose snapshot does not fit the scope, or that applicable
    /// rejects, are dropped with a warning.
    /// @return The entry to apply, or nullopt if no usable entry remains.
    auto undo(const Scope& scope, Snapshot current, const Applicable& applicable = {})
        -> std::optional<HistoryEntry>;

    /// Symmetric to undo(). Pushing onto the undo stack here does not clear
    /// the redo stack.
    auto redo(const Scope& scope, Snapshot current, const Applicable& applicable = {})
        -> std::optional<HistoryEntry>;

    auto can_undo(const Scope& scope) const -> bool { return undo_depth(scope) != 0; }
    auto can_redo(const Scope& scope) const -> bool { return redo_depth(scope) != 0; }
    auto undo_depth(const Scope& scope) const -> std::size_t;
    auto redo_depth(const Scope& scope) const -> std::size_t;
    auto peek_undo_label(const Scope& scope) const -> std::optional<std::string>;
    auto peek_redo_label(const Scope& scope) const -> std::optional<std::string>;

    /// Drop both stacks of scope.
    void clear(const Scope& scope);

    /// Drop every stack.
    void clear();

    [[nodiscard]] auto begin_restore() -> RestoreGuard { return RestoreGuard{*this}; }
    auto restoring() const -> bool { return restore_depth_ != 0; }

    auto capacities() const -> const HistoryCapacities& { return capacities_; }

private:
    struct Stacks {
        HistoryStack undo;
        HistoryStack redo;
    };

    auto stacks_for(const Scope& scope) -> Stacks&;
    auto find(const Scope& scope) const -> const Stacks*;
    auto capacity_for(ScopeKind kind) const -> std::size_t;
    auto make_entry(const Scope& scope, std::string label, Snapshot snapshot) -> HistoryEntry;
    auto take(HistoryStack& from, HistoryStack& to, const Scope& scope, Snapshot current,
              const Applicable& applicable, std::string_view direction) -> std::optional<HistoryEntry>;

    HistoryCapacities capacities_;
    TimeSource now_;
    std::map<Scope, Stacks> stacks_;
    int restore_depth_{0};
    std::uint64_t next_id_{1};
};

}  // namespace campaign_sync
