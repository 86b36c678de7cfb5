/// @file campaign_sync.hpp
/// @brief Umbrella header for the campaign-sync library.
///
/// Include this single header for access to all public types:
/// SyncController, DurableStore, ConflictMonitor, OfflineQueue, Notifier,
/// HistoryManager, the campaign model, the rules engine, SyncConfig and Error.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/config.hpp>
#include <campaign-sync/conflict_monitor.hpp>
#include <campaign-sync/durable_medium.hpp>
#include <campaign-sync/durable_store.hpp>
#include <campaign-sync/error.hpp>
#include <campaign-sync/history.hpp>
#include <campaign-sync/json.hpp>
#include <campaign-sync/notification.hpp>
#include <campaign-sync/notifier.hpp>
#include <campaign-sync/offline_queue.hpp>
#include <campaign-sync/pending_operation.hpp>
#include <campaign-sync/revision_clock.hpp>
#include <campaign-sync/rules.hpp>
#include <campaign-sync/session.hpp>
#include <campaign-sync/snapshot_codec.hpp>
#include <campaign-sync/sync_controller.hpp>
#include <campaign-sync/types.hpp>
