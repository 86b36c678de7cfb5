#include <campaign-sync/history.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace campaign_sync {

// -- Scopes -------------------------------------------------------------------

auto campaign_scope(std::string_view campaign_id) -> Scope {
    return Scope{.kind = ScopeKind::campaign, .id = std::string{campaign_id}};
}

auto relationship_scope(std::string_view relationship_id) -> Scope {
    return Scope{.kind = ScopeKind::relationship, .id = std::string{relationship_id}};
}

auto section_scope(std::string_view entity_id, SectionName section) -> Scope {
    auto id = std::string{entity_id};
    id += '#';
    id += to_string_view(section);
    return Scope{.kind = ScopeKind::section, .id = std::move(id)};
}

auto scope_kind_of(const Snapshot& snapshot) -> ScopeKind {
    switch (snapshot.index()) {
        case 1:  return ScopeKind::relationship;
        case 2:  return ScopeKind::section;
        default: return ScopeKind::campaign;
    }
}

auto snapshot_fits(const Scope& scope, const Snapshot& snapshot) -> bool {
    if (scope_kind_of(snapshot) != scope.kind) return false;
    if (const auto* camp = std::get_if<Campaign>(&snapshot)) {
        return camp->id == scope.id;
    }
    if (const auto* rel = std::get_if<RelationshipSnapshot>(&snapshot)) {
        return rel->relationship_id == scope.id &&
               (!rel->relationship || rel->relationship->id == rel->relationship_id);
    }
    const auto& sec = std::get<SectionSnapshot>(snapshot);
    return section_scope(sec.entity_id, sec.section).id == scope.id;
}

// -- HistoryStack -------------------------------------------------------------

HistoryStack::HistoryStack(std::size_t capacity)
    : capacity_{std::max<std::size_t>(capacity, 1)} {}

void HistoryStack::push(HistoryEntry entry) {
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) entries_.pop_front();
}

auto HistoryStack::pop() -> std::optional<HistoryEntry> {
    if (entries_.empty()) return std::nullopt;
    auto entry = std::move(entries_.back());
    entries_.pop_back();
    return entry;
}

auto HistoryStack::top() const -> const HistoryEntry* {
    return entries_.empty() ? nullptr : &entries_.back();
}

// -- HistoryManager -----------------------------------------------------------

HistoryManager::RestoreGuard::RestoreGuard(HistoryManager& manager) : manager_{manager} {
    ++manager_.restore_depth_;
}

HistoryManager::RestoreGuard::~RestoreGuard() {
    --manager_.restore_depth_;
}

HistoryManager::HistoryManager(HistoryCapacities capacities, TimeSource now)
    : capacities_{capacities}, now_{std::move(now)} {}

auto HistoryManager::push_undo(const Scope& scope, std::string label, Snapshot snapshot) -> bool {
    if (restoring()) return false;

    auto& stacks = stacks_for(scope);
    stacks.undo.push(make_entry(scope, std::move(label), std::move(snapshot)));
    stacks.redo.clear();
    return true;
}

auto HistoryManager::undo(const Scope& scope, Snapshot current, const Applicable& applicable)
    -> std::optional<HistoryEntry> {
    auto& stacks = stacks_for(scope);
    return take(stacks.undo, stacks.redo, scope, std::move(current), applicable, "undo");
}

auto HistoryManager::redo(const Scope& scope, Snapshot current, const Applicable& applicable)
    -> std::optional<HistoryEntry> {
    auto& stacks = stacks_for(scope);
    return take(stacks.redo, stacks.undo, scope, std::move(current), applicable, "redo");
}

auto HistoryManager::take(HistoryStack& from, HistoryStack& to, const Scope& scope,
                          Snapshot current, const Applicable& applicable,
                          std::string_view direction) -> std::optional<HistoryEntry> {
    while (auto entry = from.pop()) {
        if (!snapshot_fits(scope, entry->snapshot)) {
            SPDLOG_WARN("skipping {} entry '{}' ({}): snapshot does not match {} scope '{}'",
                        direction, entry->label, entry->id, to_string_view(scope.kind), scope.id);
            continue;
        }
        if (applicable && !applicable(*entry)) {
            SPDLOG_WARN("skipping {} entry '{}' ({}): no longer applicable",
                        direction, entry->label, entry->id);
            continue;
        }
        to.push(make_entry(scope, entry->label, std::move(current)));
        return entry;
    }
    return std::nullopt;
}

auto HistoryManager::undo_depth(const Scope& scope) const -> std::size_t {
    const auto* stacks = find(scope);
    return stacks ? stacks->undo.size() : 0;
}

auto HistoryManager::redo_depth(const Scope& scope) const -> std::size_t {
    const auto* stacks = find(scope);
    return stacks ? stacks->redo.size() : 0;
}

auto HistoryManager::peek_undo_label(const Scope& scope) const -> std::optional<std::string> {
    const auto* stacks = find(scope);
    if (!stacks || stacks->undo.empty()) return std::nullopt;
    return stacks->undo.top()->label;
}

auto HistoryManager::peek_redo_label(const Scope& scope) const -> std::optional<std::string> {
    const auto* stacks = find(scope);
    if (!stacks || stacks->redo.empty()) return std::nullopt;
    return stacks->redo.top()->label;
}

void HistoryManager::clear(const Scope& scope) {
    stacks_.erase(scope);
}

void HistoryManager::clear() {
    stacks_.clear();
}

auto HistoryManager::stacks_for(const Scope& scope) -> Stacks& {
    auto it = stacks_.find(scope);
    if (it == stacks_.end()) {
        auto cap = capacity_for(scope.kind);
        it = stacks_.emplace(scope, Stacks{HistoryStack{cap}, HistoryStack{cap}}).first;
    }
    return it->second;
}

auto HistoryManager::find(const Scope& scope) const -> const Stacks* {
    auto it = stacks_.find(scope);
    return it == stacks_.end() ? nullptr : &it->second;
}

auto HistoryManager::capacity_for(ScopeKind kind) const -> std::size_t {
    switch (kind) {
        case ScopeKind::campaign:     return capacities_.campaign;
        case ScopeKind::relationship: return capacities_.relationship;
        case ScopeKind::section:      return capacities_.section;
    }
    return capacities_.campaign;
}

auto HistoryManager::make_entry(const Scope& scope, std::string label, Snapshot snapshot)
    -> HistoryEntry {
    return HistoryEntry{
        .id = "h" + std::to_string(next_id_++),
        .created_at = now_(),
        .label = std::move(label),
        .target = scope,
        .snapshot = std::move(snapshot),
    };
}

}  // namespace campaign_sync
