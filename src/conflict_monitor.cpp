#include <campaign-sync/conflict_monitor.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace campaign_sync {

ConflictMonitor::ConflictMonitor(SessionContext& session, DurableStore& store)
    : session_{session}, store_{store} {}

void ConflictMonitor::observe(const RevisionToken& external_revision) {
    if (external_revision.empty()) return;
    if (RevisionClock::compare(external_revision, session_.known_revision) == Comparison::equal) {
        return;
    }

    if (state_.active) {
        state_.observed_revision = external_revision;
        changed();
        return;
    }

    state_.active = true;
    state_.dismissed = false;
    state_.since_revision = session_.known_revision;
    state_.observed_revision = external_revision;
    state_.local_edit_count = 0;
    SPDLOG_WARN("conflict: durable revision {} differs from known {}",
                external_revision.value, session_.known_revision.value);
    changed();
}

void ConflictMonitor::record_local_attempt() {
    if (!state_.active) return;
    ++state_.local_edit_count;
    state_.dismissed = false;
    changed();
}

void ConflictMonitor::acknowledge(const RevisionToken& committed) {
    session_.known_revision = committed;
}

auto ConflictMonitor::check() -> bool {
    observe(store_.current_revision(session_.user));
    return state_.active;
}

auto ConflictMonitor::resolve(ResolutionKind kind) -> std::optional<RevisionToken> {
    switch (kind) {
        case ResolutionKind::dismiss:
            if (state_.active && !state_.dismissed) {
                state_.dismissed = true;
                changed();
            }
            return std::nullopt;

        case ResolutionKind::reload_latest: {
            if (auto stored = store_.get(session_.user)) {
                session_.campaigns = std::move(stored->campaigns);
                session_.known_revision = std::move(stored->revision);
            }
            SPDLOG_INFO("conflict resolved by reloading revision {}", session_.known_revision.value);
            clear();
            return session_.known_revision;
        }

        case ResolutionKind::force_overwrite: {
            auto token = store_.put(session_.user, session_.campaigns);
            session_.known_revision = token;
            SPDLOG_INFO("conflict resolved by overwriting with revision {}", token.value);
            clear();
            return token;
        }
    }
    return std::nullopt;
}

void ConflictMonitor::on_change(Listener listener) {
    listeners_.push_back(std::move(listener));
}

void ConflictMonitor::clear() {
    state_ = ConflictState{};
    changed();
}

void ConflictMonitor::changed() {
    for (const auto& listener : listeners_) {
        listener(state_);
    }
}

}  // namespace campaign_sync
