/// @file conflict_monitor.hpp
/// @brief ConflictMonitor: detects concurrent writers and holds the sticky conflict flag.

#pragma once

#include <campaign-sync/durable_store.hpp>
#include <campaign-sync/session.hpp>
#include <campaign-sync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace campaign_sync {

/// Receives revisions observed outside this context, whatever carried them
/// (a notification, a storage-change event, a periodic comparison).
class ConsistencyOracle {
public:
    virtual ~ConsistencyOracle() = default;

    /// Report a revision seen in the durable store or announced by a peer.
    virtual void observe(const RevisionToken& external_revision) = 0;
};

/// The sticky conflict flag.
struct ConflictState {
    bool active{false};
    RevisionToken since_revision;     ///< Revision this context knew when the conflict was raised.
    RevisionToken observed_revision;  ///< Latest external revision seen while active.
    std::size_t local_edit_count{0};  ///< Local writes attempted while active.
    bool dismissed{false};            ///< UI signal hidden; the condition still holds.

    auto operator==(const ConflictState&) const -> bool = default;
};

/// How the user settles a conflict.
enum class ResolutionKind : std::uint8_t {
    reload_latest,    ///< Take theirs: replace local state with the durable state.
    force_overwrite,  ///< Keep mine: commit local state over the durable state.
    dismiss,          ///< Hide the signal until the next local write attempt.
};

constexpr auto to_string_view(ResolutionKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ResolutionKind::reload_latest:   return "reload_latest";
        case ResolutionKind::force_overwrite: return "force_overwrite";
        case ResolutionKind::dismiss:         return "dismiss";
    }
    return "unknown";
}

/// Raises a conflict when the durable revision moves away from the one this
/// context knows, and keeps it raised until the user resolves it.
///
/// A successful commit by this context never clears an active conflict.
class ConflictMonitor : public ConsistencyOracle {
public:
    using Listener = std::function<void(const ConflictState&)>;

    ConflictMonitor(SessionContext& session, DurableStore& store);

    void observe(const RevisionToken& external_revision) override;

    /// Note a local write attempt. While active this bumps local_edit_count
    /// and re-shows a dismissed conflict.
    void record_local_attempt();

    /// Record a revision this context committed itself.
    void acknowledge(const RevisionToken& committed);

    /// Compare the durable revision with the known one and observe it.
    /// @return Whether a conflict is active afterwards.
    auto check() -> bool;

    /// Settle the conflict.
    /// @return The revision the context now knows, for reload_latest and
    ///   force_overwrite; nullopt for dismiss.
    /// @throws Failure if the reload or overwrite fails; the conflict then stays active.
    auto resolve(ResolutionKind kind) -> std::optional<RevisionToken>;

    auto state() const -> const ConflictState& { return state_; }
    auto active() const -> bool { return state_.active; }

    /// Whether the UI should currently show the conflict.
    auto visible() const -> bool { return state_.active && !state_.dismissed; }

    /// Called after every change of state().
    void on_change(Listener listener);

private:
    void clear();
    void changed();

    SessionContext& session_;
    DurableStore& store_;
    ConflictState state_;
    std::vector<Listener> listeners_;
};

}  // namespace campaign_sync
