/// @file json.hpp
/// @brief nlohmann/json serialization for campaign-sync types.
///
/// Provides ADL serialization (to_json/from_json) for the campaign model,
/// identity types, queued operations and notification messages. This is the
/// body format inside the durable snapshot envelope, the persisted
/// pending-ops queue and the cross-context wire message.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/notification.hpp>
#include <campaign-sync/pending_operation.hpp>
#include <campaign-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace campaign_sync {

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const ClientId& id);
void from_json(const nlohmann::json& j, ClientId& id);

void to_json(nlohmann::json& j, const RevisionToken& token);
void from_json(const nlohmann::json& j, RevisionToken& token);

// -- Enums (string names) -----------------------------------------------------

void to_json(nlohmann::json& j, EntityKind kind);
void from_json(const nlohmann::json& j, EntityKind& kind);

void to_json(nlohmann::json& j, StressTrack track);
void from_json(const nlohmann::json& j, StressTrack& track);

void to_json(nlohmann::json& j, Severity severity);
void from_json(const nlohmann::json& j, Severity& severity);

void to_json(nlohmann::json& j, OperationKind kind);
void from_json(const nlohmann::json& j, OperationKind& kind);

// -- Campaign model -----------------------------------------------------------

void to_json(nlohmann::json& j, const SectionItem& item);
void from_json(const nlohmann::json& j, SectionItem& item);

void to_json(nlohmann::json& j, const Fallout& f);
void from_json(const nlohmann::json& j, Fallout& f);

void to_json(nlohmann::json& j, const Entity& e);
void from_json(const nlohmann::json& j, Entity& e);

void to_json(nlohmann::json& j, const Relationship& r);
void from_json(const nlohmann::json& j, Relationship& r);

void to_json(nlohmann::json& j, const CustomRules& rules);
void from_json(const nlohmann::json& j, CustomRules& rules);

void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);

void to_json(nlohmann::json& j, const LogEntry& entry);
void from_json(const nlohmann::json& j, LogEntry& entry);

void to_json(nlohmann::json& j, const Campaign& c);
void from_json(const nlohmann::json& j, Campaign& c);

void to_json(nlohmann::json& j, const CampaignSet& set);
void from_json(const nlohmann::json& j, CampaignSet& set);

// -- Queue and wire records ---------------------------------------------------

void to_json(nlohmann::json& j, const PendingOperation& op);
void from_json(const nlohmann::json& j, PendingOperation& op);

void to_json(nlohmann::json& j, const NotificationMessage& msg);
void from_json(const nlohmann::json& j, NotificationMessage& msg);

// -- Text helpers -------------------------------------------------------------

/// Serialize a notification to its wire text.
auto encode_message(const NotificationMessage& msg) -> std::string;

/// Parse wire text into a notification.
/// @return The message, or nullopt if the text is not a well-formed message.
auto decode_message(std::string_view text) -> std::optional<NotificationMessage>;

/// Serialize a queue to text for the `pending-ops` key.
auto encode_queue(const std::vector<PendingOperation>& ops) -> std::string;

/// Parse a persisted queue.
/// @return The operations, or nullopt if the text is malformed.
auto decode_queue(std::string_view text) -> std::optional<std::vector<PendingOperation>>;

}  // namespace campaign_sync
