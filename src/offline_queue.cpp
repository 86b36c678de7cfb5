#include <campaign-sync/offline_queue.hpp>
#include <campaign-sync/error.hpp>
#include <campaign-sync/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace campaign_sync {

auto parse_operation_kind(std::string_view s) -> std::optional<OperationKind> {
    if (s == "save_campaigns") return OperationKind::save_campaigns;
    return std::nullopt;
}

OfflineQueue::OfflineQueue(SessionContext& session, DurableStore& store,
                           ConsistencyOracle& oracle, std::size_t capacity)
    : session_{session}, store_{store}, oracle_{oracle}, capacity_{std::max<std::size_t>(capacity, 1)} {}

void OfflineQueue::restore() {
    ops_.clear();
    auto blob = store_.medium().read(user_key(session_.user, keys::pending_ops));
    if (!blob) return;

    auto ops = decode_queue(blob_text(*blob));
    if (!ops) {
        SPDLOG_WARN("discarding unreadable pending-ops queue for '{}'", session_.user);
        return;
    }
    ops_.assign(ops->begin(), ops->end());
    while (ops_.size() > capacity_) ops_.pop_front();
    SPDLOG_INFO("restored {} pending operation(s) for '{}'", ops_.size(), session_.user);
}

void OfflineQueue::enqueue(PendingOperation op) {
    SPDLOG_DEBUG("queueing {} '{}' based on revision '{}'",
                 to_string_view(op.kind), op.id, op.base_revision.value);
    ops_.push_back(std::move(op));
    while (ops_.size() > capacity_) {
        SPDLOG_WARN("pending-ops queue full, evicting '{}'", ops_.front().id);
        ops_.pop_front();
    }
    persist();
}

auto OfflineQueue::flush() -> std::size_t {
    auto kinds = std::vector<OperationKind>{};
    for (const auto& op : ops_) {
        if (std::ranges::find(kinds, op.kind) == kinds.end()) kinds.push_back(op.kind);
    }

    auto retired = std::size_t{0};
    for (auto kind : kinds) {
        auto newest = std::ranges::find_if(ops_.rbegin(), ops_.rend(),
            [kind](const PendingOperation& op) { return op.kind == kind; });

        auto current = store_.current_revision(session_.user);
        if (!newest->base_revision.empty() &&
            RevisionClock::compare(newest->base_revision, current) == Comparison::different) {
            SPDLOG_WARN("refusing to flush '{}': based on '{}', durable revision is '{}'",
                        newest->id, newest->base_revision.value, current.value);
            oracle_.observe(current);
            throw Failure{ErrorKind::queue_flush_rejected,
                          "pending operation '" + newest->id + "' is based on a stale revision"};
        }

        auto token = store_.put(session_.user, newest->payload);
        session_.known_revision = token;
        auto removed = clear_kind(kind);
        SPDLOG_INFO("flushed {} pending operation(s), now at revision {}", removed, token.value);
        retired += removed;
    }
    return retired;
}

auto OfflineQueue::discard(const std::vector<std::string>& ids) -> std::size_t {
    auto removed = std::erase_if(ops_, [&](const PendingOperation& op) {
        return std::ranges::find(ids, op.id) != ids.end();
    });
    if (removed != 0) persist();
    return removed;
}

auto OfflineQueue::clear_kind(OperationKind kind) -> std::size_t {
    auto removed = std::erase_if(ops_, [kind](const PendingOperation& op) {
        return op.kind == kind;
    });
    if (removed != 0) persist();
    return removed;
}

void OfflineQueue::persist() {
    const auto key = user_key(session_.user, keys::pending_ops);
    try {
        if (ops_.empty()) {
            store_.medium().remove(key);
        } else {
            store_.medium().write(key, to_blob(encode_queue({ops_.begin(), ops_.end()})));
        }
    } catch (const Failure& e) {
        // The in-memory queue is still intact; it is written again on the next change.
        SPDLOG_ERROR("could not persist pending-ops queue: {}", e.what());
    }
}

}  // namespace campaign_sync
