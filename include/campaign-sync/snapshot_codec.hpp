/// @file snapshot_codec.hpp
/// @brief SnapshotCodec: durable byte form of a CampaignSet and deep clones.

#pragma once

#include <campaign-sync/campaign.hpp>
#include <campaign-sync/types.hpp>

#include <cstddef>
#include <optional>
#include <span>

namespace campaign_sync {

/// Serializes campaign sets to checksummed, optionally compressed blobs.
///
/// The blob is an envelope (magic, CRC-32, payload type, length) around the
/// JSON form of the set. Bodies above the deflate threshold are stored raw
/// DEFLATE compressed.
///
/// @code
/// auto codec = SnapshotCodec{};
/// auto blob = codec.encode(set);
/// auto back = codec.decode(blob);   // nullopt if the blob is damaged
/// @endcode
class SnapshotCodec {
public:
    /// Bodies smaller than this are stored uncompressed.
    static constexpr std::size_t default_deflate_threshold = 4096;

    /// Largest body decode() will inflate; anything bigger is treated as damage.
    static constexpr std::size_t max_body_size = std::size_t{64} * 1024 * 1024;

    SnapshotCodec() = default;
    explicit SnapshotCodec(std::size_t deflate_threshold)
        : deflate_threshold_{deflate_threshold} {}

    /// Serialize a set.
    /// @throws Failure (storage_write_failure) if the set cannot be serialized,
    ///   e.g. a string is not valid UTF-8.
    auto encode(const CampaignSet& set) const -> Blob;

    /// Parse a blob produced by encode().
    /// @return The set, or nullopt if the blob is malformed or fails its checksum.
    auto decode(std::span<const std::byte> blob) const -> std::optional<CampaignSet>;

    /// Deep, isolated copy of a campaign. The model is made of value types,
    /// so a member-wise copy shares no mutable structure with the source.
    static auto clone(const Campaign& campaign) -> Campaign { return campaign; }

    /// Deep, isolated copy of a campaign set.
    static auto clone(const CampaignSet& set) -> CampaignSet { return set; }

    auto deflate_threshold() const -> std::size_t { return deflate_threshold_; }

private:
    std::size_t deflate_threshold_ = default_deflate_threshold;
};

}  // namespace campaign_sync
