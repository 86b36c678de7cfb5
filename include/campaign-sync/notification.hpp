/// @file notification.hpp
/// @brief Cross-context notification types: Event and its wire message.

#pragma once

#include <campaign-sync/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace campaign_sync {

/// The kinds of event a Notifier carries.
enum class EventKind : std::uint8_t {
    write_committed,  ///< A context committed a new revision.
};

/// The wire `type` string for EventKind::write_committed.
inline constexpr std::string_view campaign_saved_type = "campaign_saved";

/// A "write happened" event as seen by subscribers.
struct Event {
    EventKind kind{EventKind::write_committed};
    RevisionToken revision;
    std::string campaign_id;
    std::string actor_label;
    std::string actor_role;

    auto operator==(const Event&) const -> bool = default;
};

/// The message exchanged between contexts over a Transport.
///
/// Serialized as `{type, revision, campaignId, actor, actorRole, clientId, time}`.
struct NotificationMessage {
    std::string type{campaign_saved_type};
    RevisionToken revision;
    std::string campaign_id;
    std::string actor;
    std::string actor_role;
    ClientId client_id;
    Millis time{0};

    auto operator==(const NotificationMessage&) const -> bool = default;
};

}  // namespace campaign_sync
