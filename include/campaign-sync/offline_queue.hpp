/// @file offline_queue.hpp
/// @brief OfflineQueue: durable log of writes waiting to be committed.

#pragma once

#include <campaign-sync/conflict_monitor.hpp>
#include <campaign-sync/durable_store.hpp>
#include <campaign-sync/pending_operation.hpp>
#include <campaign-sync/session.hpp>

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace campaign_sync {

/// An ordered, bounded log of writes that could not be committed, either
/// because the context was offline or because a conflict was active.
///
/// The queue persists itself under the user's `pending-ops` key after every
/// change so it survives a reload. It is flushed only in response to events
/// (connectivity regained, user retry), never polled.
class OfflineQueue {
public:
    static constexpr std::size_t default_capacity = 50;

    OfflineQueue(SessionContext& session, DurableStore& store, ConsistencyOracle& oracle,
                 std::size_t capacity = default_capacity);

    /// Load the persisted queue, replacing the in-memory one. A damaged
    /// persisted queue is logged and treated as empty.
    void restore();

    /// Append an operation, evicting the oldest entries beyond capacity.
    void enqueue(PendingOperation op);

    /// Commit the newest queued operation of each kind.
    ///
    /// An operation commits only if its base revision is empty or equals the
    /// durable revision; then every queued operation of that kind is dropped.
    /// @return The number of queued operations retired.
    /// @throws Failure (queue_flush_rejected) if a base revision is stale; the
    ///   durable revision is reported to the oracle and the queue is kept.
    /// @throws Failure (storage_write_failure) if the commit fails; the queue is kept.
    auto flush() -> std::size_t;

    /// Remove the operations with the given ids.
    /// @return The number removed.
    auto discard(const std::vector<std::string>& ids) -> std::size_t;

    /// Remove every operation of a kind.
    /// @return The number removed.
    auto clear_kind(OperationKind kind) -> std::size_t;

    auto entries() const -> const std::deque<PendingOperation>& { return ops_; }
    auto size() const -> std::size_t { return ops_.size(); }
    auto empty() const -> bool { return ops_.empty(); }
    auto capacity() const -> std::size_t { return capacity_; }

private:
    void persist();

    SessionContext& session_;
    DurableStore& store_;
    ConsistencyOracle& oracle_;
    std::size_t capacity_;
    std::deque<PendingOperation> ops_;
};

}  // namespace campaign_sync
