/// @file durable_store.hpp
/// @brief DurableStore: the revisioned record of one user's campaigns.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/durable_medium.hpp>
#include <campaign-sync/revision_clock.hpp>
#include <campaign-sync/snapshot_codec.hpp>
#include <campaign-sync/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace campaign_sync {

/// Storage key names. Every key is scoped by user as `<user>/<name>`.
namespace keys {
inline constexpr std::string_view campaigns = "campaigns";
inline constexpr std::string_view revision = "campaigns-rev";
inline constexpr std::string_view backup = "campaigns-backup";
inline constexpr std::string_view backup_timestamp = "campaigns-backup-ts";
inline constexpr std::string_view pending_ops = "pending-ops";
}  // namespace keys

/// Build the user-scoped storage key for name.
auto user_key(std::string_view user, std::string_view name) -> std::string;

/// A committed campaign set and the revision it was committed under.
struct StoredCampaigns {
    CampaignSet campaigns;
    RevisionToken revision;
};

/// The rolling last-good copy written alongside every commit.
struct Backup {
    CampaignSet campaigns;
    Millis saved_at{0};
};

/// The single writer-of-record for a user's campaigns.
///
/// put() writes the primary copy, then the backup copy and its timestamp,
/// and only then publishes a fresh revision. A failure at any step leaves
/// the previous revision in place and restores the previous primary copy,
/// so callers observe either the whole commit or none of it.
///
/// Announcing the commit to other contexts is the caller's job.
class DurableStore {
public:
    DurableStore(DurableMedium& medium, RevisionClock& clock, SnapshotCodec codec = {});

    /// Commit a campaign set for user.
    /// @return The new revision, different from every earlier one.
    /// @throws Failure (storage_write_failure) if serialization or a write fails.
    auto put(const UserId& user, const CampaignSet& campaigns) -> RevisionToken;

    /// Load the last committed set for user.
    ///
    /// Falls back to the backup copy when the primary copy is damaged.
    /// @return The set and its revision, or nullopt if user has never committed.
    /// @throws Failure (snapshot_corrupt) if both copies are unreadable.
    auto get(const UserId& user) const -> std::optional<StoredCampaigns>;

    /// The revision currently published for user (empty if none).
    auto current_revision(const UserId& user) const -> RevisionToken;

    /// Load the backup copy, or nullopt if there is none or it is damaged.
    auto load_backup(const UserId& user) const -> std::optional<Backup>;

    auto medium() -> DurableMedium& { return medium_; }
    auto codec() const -> const SnapshotCodec& { return codec_; }

private:
    DurableMedium& medium_;
    RevisionClock& clock_;
    SnapshotCodec codec_;
};

}  // namespace campaign_sync
