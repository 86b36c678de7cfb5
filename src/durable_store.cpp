#include <campaign-sync/durable_store.hpp>
#include <campaign-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <utility>

namespace campaign_sync {

auto user_key(std::string_view user, std::string_view name) -> std::string {
    auto key = std::string{user};
    key += '/';
    key += name;
    return key;
}

DurableStore::DurableStore(DurableMedium& medium, RevisionClock& clock, SnapshotCodec codec)
    : medium_{medium}, clock_{clock}, codec_{codec} {}

auto DurableStore::put(const UserId& user, const CampaignSet& campaigns) -> RevisionToken {
    const auto blob = codec_.encode(campaigns);

    const auto primary_key = user_key(user, keys::campaigns);
    const auto backup_key = user_key(user, keys::backup);
    const auto timestamp_key = user_key(user, keys::backup_timestamp);
    const auto previous = medium_.read(primary_key);
    const auto previous_backup = medium_.read(backup_key);
    const auto previous_timestamp = medium_.read(timestamp_key);

    // Put every key back the way it was before this commit started.
    const auto restore = [this](const std::string& key, const std::optional<Blob>& value) {
        if (value) {
            medium_.write(key, *value);
        } else {
            medium_.remove(key);
        }
    };

    try {
        medium_.write(primary_key, blob);
        medium_.write(backup_key, blob);
        medium_.write(timestamp_key, to_blob(std::to_string(clock_.now())));

        auto token = clock_.next();
        medium_.write(user_key(user, keys::revision), to_blob(token.value));
        SPDLOG_DEBUG("committed {} bytes for '{}' at revision {}", blob.size(), user, token.value);
        return token;
    } catch (const Failure& e) {
        SPDLOG_ERROR("commit for '{}' failed: {}", user, e.what());
        try {
            restore(primary_key, previous);
            restore(backup_key, previous_backup);
            restore(timestamp_key, previous_timestamp);
        } catch (const Failure& rollback) {
            SPDLOG_ERROR("could not restore previous copy for '{}': {}", user, rollback.what());
        }
        throw;
    }
}

auto DurableStore::get(const UserId& user) const -> std::optional<StoredCampaigns> {
    auto blob = medium_.read(user_key(user, keys::campaigns));
    if (!blob) return std::nullopt;

    auto revision = current_revision(user);
    if (auto set = codec_.decode(*blob)) {
        return StoredCampaigns{.campaigns = std::move(*set), .revision = std::move(revision)};
    }

    SPDLOG_WARN("primary campaigns copy for '{}' is damaged, trying backup", user);
    if (auto backup = load_backup(user)) {
        return StoredCampaigns{.campaigns = std::move(backup->campaigns), .revision = std::move(revision)};
    }
    throw Failure{ErrorKind::snapshot_corrupt,
                  "campaigns for '" + user + "' and their backup are unreadable"};
}

auto DurableStore::current_revision(const UserId& user) const -> RevisionToken {
    auto blob = medium_.read(user_key(user, keys::revision));
    if (!blob) return {};
    return RevisionToken{blob_text(*blob)};
}

auto DurableStore::load_backup(const UserId& user) const -> std::optional<Backup> {
    auto blob = medium_.read(user_key(user, keys::backup));
    if (!blob) return std::nullopt;
    auto set = codec_.decode(*blob);
    if (!set) return std::nullopt;

    auto saved_at = Millis{0};
    if (auto ts = medium_.read(user_key(user, keys::backup_timestamp))) {
        auto text = blob_text(*ts);
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), saved_at);
        if (ec != std::errc{}) {
            SPDLOG_WARN("backup timestamp for '{}' is not a number: '{}'", user, text);
            saved_at = 0;
        }
    }
    return Backup{.campaigns = std::move(*set), .saved_at = saved_at};
}

}  // namespace campaign_sync
