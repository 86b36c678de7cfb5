/// @file config.hpp
/// @brief SyncConfig: runtime settings and their JSON loader.

#pragma once

#include <campaign-sync/history.hpp>
#include <campaign-sync/notifier.hpp>
#include <campaign-sync/snapshot_codec.hpp>
#include <campaign-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace campaign_sync {

/// Settings for one execution context. Every field has a usable default.
///
/// JSON form (all keys optional):
/// @code
/// {
///   "user": "alice",
///   "actorLabel": "Alice",
///   "actorRole": "gm",
///   "history": {"campaign": 20, "relationship": 30, "section": 20},
///   "queueCapacity": 50,
///   "deflateThreshold": 4096,
///   "logLevel": "info",
///   "storageDirectory": "/var/lib/campaign-sync",
///   "remote": {"endpoint": "wss://relay.example", "channel": "alice",
///              "apiKey": "...", "connectTimeoutMs": 5000}
/// }
/// @endcode
struct SyncConfig {
    UserId user{"local"};
    std::string actor_label{"GM"};
    std::string actor_role{"gm"};
    HistoryCapacities history;
    std::size_t queue_capacity{50};
    std::size_t deflate_threshold{SnapshotCodec::default_deflate_threshold};
    std::string log_level{"info"};
    std::string storage_directory;         ///< Empty: keep data in memory.
    std::optional<RemoteConfig> remote;    ///< Set to request a remote transport.

    auto operator==(const SyncConfig&) const -> bool = default;
};

/// Build a config from parsed JSON, starting from the defaults.
/// @throws Failure (invalid_config) on a wrong type or out-of-range value.
auto load_config(const nlohmann::json& j) -> SyncConfig;

/// Read and parse a JSON config file.
/// @throws Failure (invalid_config) if the file is unreadable or invalid.
auto load_config_file(const std::filesystem::path& path) -> SyncConfig;

/// Serialize a config to the JSON form load_config() accepts.
auto config_json(const SyncConfig& config) -> nlohmann::json;

/// Set the default spdlog logger's level from a name ("trace", "debug",
/// "info", "warn", "error", "critical", "off").
/// @throws Failure (invalid_config) for an unknown name.
void configure_logging(std::string_view level);

}  // namespace campaign_sync
