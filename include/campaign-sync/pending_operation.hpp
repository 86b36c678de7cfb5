/// @file pending_operation.hpp
/// @brief PendingOperation: a write queued for later commit.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace campaign_sync {

/// What a queued operation would do when flushed.
enum class OperationKind : std::uint8_t {
    save_campaigns,  ///< Commit a full CampaignSet for the user.
};

constexpr auto to_string_view(OperationKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OperationKind::save_campaigns: return "save_campaigns";
    }
    return "unknown";
}

auto parse_operation_kind(std::string_view s) -> std::optional<OperationKind>;

/// A write that could not be committed when it was made.
///
/// `base_revision` is the revision its author believed was current. A
/// non-empty base that no longer matches the durable revision turns the
/// flush into a surfaced conflict instead of an overwrite.
struct PendingOperation {
    std::string id;
    Millis created_at{0};
    OperationKind kind{OperationKind::save_campaigns};
    RevisionToken base_revision;
    std::string campaign_id;  ///< The campaign whose edit produced this write.
    CampaignSet payload;      ///< Full state to commit.

    auto operator==(const PendingOperation&) const -> bool = default;
};

}  // namespace campaign_sync
