/// @file types.hpp
/// @brief Core identity types: ClientId, RevisionToken, UserId.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace campaign_sync {

/// Identifies the user whose campaigns are stored. All storage keys are
/// scoped by it.
using UserId = std::string;

/// Milliseconds since the Unix epoch.
using Millis = std::int64_t;

/// An opaque value held by a DurableMedium.
using Blob = std::vector<std::byte>;

/// Copy text into a Blob.
auto to_blob(std::string_view text) -> Blob;

/// Copy a Blob's bytes into a string.
auto blob_text(std::span<const std::byte> blob) -> std::string;

/// A 16-byte identifier for one execution context (a tab, a device).
///
/// Every SyncController gets its own ClientId; it is stamped on outgoing
/// notifications so a context can recognise its own echoes.
struct ClientId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr ClientId() = default;

    /// Construct from a byte array.
    explicit constexpr ClientId(std::array<std::byte, size> b) : bytes{b} {}

    auto operator==(const ClientId&) const -> bool = default;

    /// Lowercase hex rendering (32 characters).
    auto to_hex() const -> std::string;

    /// Parse a 32-character hex string.
    /// @return The id, or nullopt if the string is not valid hex of the right length.
    static auto from_hex(std::string_view hex) -> std::optional<ClientId>;

    /// Generate a random id.
    static auto random() -> ClientId;
};

/// Opaque marker identifying the durable state as of the last accepted write.
///
/// Tokens are compared for equality only; they carry no ordering. An empty
/// token means "no committed revision yet".
struct RevisionToken {
    std::string value;  ///< Opaque token text, stored verbatim under `campaigns-rev`.

    RevisionToken() = default;
    explicit RevisionToken(std::string v) : value{std::move(v)} {}

    auto empty() const -> bool { return value.empty(); }

    auto operator==(const RevisionToken&) const -> bool = default;
};

}  // namespace campaign_sync
