#include <campaign-sync/snapshot_codec.hpp>
#include <campaign-sync/error.hpp>
#include <campaign-sync/json.hpp>

#include "storage/compression.hpp"
#include "storage/envelope.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace campaign_sync {

auto SnapshotCodec::encode(const CampaignSet& set) const -> Blob {
    auto text = std::string{};
    try {
        text = nlohmann::json(set).dump();
    } catch (const nlohmann::json::exception& e) {
        throw Failure{ErrorKind::storage_write_failure,
                      std::string{"cannot serialize campaigns: "} + e.what()};
    }

    auto body = to_blob(text);
    auto type = storage::PayloadType::json;
    if (body.size() >= deflate_threshold_) {
        auto deflated = Blob{};
        if (storage::deflate_snapshot_body(body, deflated)) {
            body = std::move(deflated);
            type = storage::PayloadType::deflated_json;
        } else {
            SPDLOG_WARN("deflate failed, storing {} byte snapshot uncompressed", body.size());
        }
    }

    auto output = Blob{};
    output.reserve(body.size() + 16);
    storage::write_envelope(type, body, output);
    return output;
}

auto SnapshotCodec::decode(std::span<const std::byte> blob) const -> std::optional<CampaignSet> {
    auto header = storage::parse_envelope_header(blob);
    if (!header) return std::nullopt;

    auto body = storage::envelope_body(*header, blob);
    if (!body) return std::nullopt;

    auto inflated = Blob{};
    if (header->type == storage::PayloadType::deflated_json) {
        auto out = storage::inflate_snapshot_body(*body, max_body_size);
        if (out.status != storage::InflateStatus::ok) {
            SPDLOG_WARN("cannot inflate {} byte snapshot body: {}", body->size(),
                        storage::to_string_view(out.status));
            return std::nullopt;
        }
        inflated = std::move(out.body);
        body = std::span<const std::byte>{inflated};
    }

    auto j = nlohmann::json::parse(blob_text(*body), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    try {
        return j.get<CampaignSet>();
    } catch (const nlohmann::json::exception& e) {
        SPDLOG_WARN("snapshot body does not match the campaign schema: {}", e.what());
    } catch (const std::runtime_error& e) {
        SPDLOG_WARN("snapshot body does not match the campaign schema: {}", e.what());
    }
    return std::nullopt;
}

}  // namespace campaign_sync
