#pragma once

// Envelope for durable snapshot blobs.
//
//   magic (4 bytes: 0x43 0x53 0x59 0x4E, "CSYN")
//   checksum (4 bytes: zlib CRC-32 of body, little endian)
//   payload type (1 byte)
//   body_length (ULEB128)
//   body (body_length bytes)
//
// Internal header, not installed.

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace campaign_sync::storage {

inline constexpr std::array<std::byte, 4> envelope_magic = {
    std::byte{0x43}, std::byte{0x53}, std::byte{0x59}, std::byte{0x4E}
};

// How the body is encoded.
enum class PayloadType : std::uint8_t {
    json          = 0x00,
    deflated_json = 0x01,
};

struct EnvelopeHeader {
    PayloadType type;
    std::uint32_t checksum;
    std::size_t body_offset;  // offset into the original data where body starts
    std::size_t body_length;
};

// -- Length prefix (unsigned LEB128) ------------------------------------------

inline void write_length(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) byte |= std::byte{0x80};
        output.push_back(byte);
    } while (value != 0);
}

// Returns {value, bytes consumed}, or nullopt on truncation/overflow.
inline auto read_length(std::span<const std::byte> input)
    -> std::optional<std::pair<std::uint64_t, std::size_t>> {
    auto value = std::uint64_t{0};
    auto shift = 0u;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (shift >= 64) return std::nullopt;
        value |= (static_cast<std::uint64_t>(input[i]) & 0x7F) << shift;
        shift += 7;
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return std::pair{value, i + 1};
        }
    }
    return std::nullopt;
}

// -- Checksum -----------------------------------------------------------------

inline auto compute_checksum(std::span<const std::byte> body) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    if (!body.empty()) {
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(body.data()),
                      static_cast<uInt>(body.size()));
    }
    return static_cast<std::uint32_t>(crc);
}

// -- Header -------------------------------------------------------------------

// Parse an envelope header from the beginning of data.
// Returns nullopt if the data is malformed.
inline auto parse_envelope_header(std::span<const std::byte> data)
    -> std::optional<EnvelopeHeader> {

    if (data.size() < envelope_magic.size()) return std::nullopt;
    if (std::memcmp(data.data(), envelope_magic.data(), envelope_magic.size()) != 0) {
        return std::nullopt;
    }

    auto pos = envelope_magic.size();

    if (pos + 4 > data.size()) return std::nullopt;
    auto checksum = std::uint32_t{0};
    for (std::size_t i = 0; i < 4; ++i) {
        checksum |= static_cast<std::uint32_t>(data[pos + i]) << (8 * i);
    }
    pos += 4;

    if (pos >= data.size()) return std::nullopt;
    auto raw_type = static_cast<std::uint8_t>(data[pos]);
    if (raw_type > static_cast<std::uint8_t>(PayloadType::deflated_json)) return std::nullopt;
    ++pos;

    auto length = read_length(data.subspan(pos));
    if (!length) return std::nullopt;
    pos += length->second;

    return EnvelopeHeader{
        .type = static_cast<PayloadType>(raw_type),
        .checksum = checksum,
        .body_offset = pos,
        .body_length = static_cast<std::size_t>(length->first),
    };
}

// The body of a parsed envelope, or nullopt if it is truncated or the
// checksum does not match.
inline auto envelope_body(const EnvelopeHeader& header, std::span<const std::byte> data)
    -> std::optional<std::span<const std::byte>> {
    if (header.body_offset > data.size()) return std::nullopt;
    if (header.body_length > data.size() - header.body_offset) return std::nullopt;
    auto body = data.subspan(header.body_offset, header.body_length);
    if (compute_checksum(body) != header.checksum) return std::nullopt;
    return body;
}

// Write a complete envelope to output.
inline void write_envelope(PayloadType type, std::span<const std::byte> body,
                           std::vector<std::byte>& output) {
    output.insert(output.end(), envelope_magic.begin(), envelope_magic.end());

    auto checksum = compute_checksum(body);
    for (std::size_t i = 0; i < 4; ++i) {
        output.push_back(static_cast<std::byte>((checksum >> (8 * i)) & 0xFF));
    }

    output.push_back(static_cast<std::byte>(type));
    write_length(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

}  // namespace campaign_sync::storage
