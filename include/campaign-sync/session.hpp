/// @file session.hpp
/// @brief SessionContext: per-context state shared by the sync components.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/types.hpp>

#include <string>

namespace campaign_sync {

/// Everything one execution context knows about its session.
///
/// Constructed once at startup and passed by reference to every
/// component. The campaigns held here are this context's private copy;
/// other contexts only learn about them through the durable store.
struct SessionContext {
    UserId user;
    ClientId client_id;
    std::string actor_label;          ///< Display name stamped on notifications.
    std::string actor_role{"gm"};     ///< "gm" or "player".
    CampaignSet campaigns;            ///< Live in-memory state.
    RevisionToken known_revision;     ///< Last durable revision this context saw or wrote.
    bool online = true;               ///< Connectivity as last reported by the host.
};

}  // namespace campaign_sync
