#pragma once

// Raw DEFLATE streams for snapshot bodies above the codec's threshold.
//
// Both directions run zlib in fixed-size chunks, so neither the input nor
// the output has to fit a single uInt-sized zlib call. Inflation stops as
// soon as the output would pass the caller's limit, and reports why a body
// was refused so the codec can log it.
//
// Internal header, not installed.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace campaign_sync::storage {

inline constexpr std::size_t zlib_chunk = 16 * 1024;

/// Raw deflate window bits (negative means no zlib or gzip header).
inline constexpr int raw_window_bits = -15;

enum class InflateStatus : std::uint8_t {
    ok,
    init_failed,
    corrupt,        ///< zlib rejected the stream.
    truncated,      ///< Input ended before the final block.
    too_large,      ///< Output would pass the caller's limit.
    trailing_bytes, ///< Bytes follow the final block.
};

constexpr auto to_string_view(InflateStatus status) noexcept -> std::string_view {
    switch (status) {
        case InflateStatus::ok:             return "ok";
        case InflateStatus::init_failed:    return "inflater could not start";
        case InflateStatus::corrupt:        return "corrupt deflate stream";
        case InflateStatus::truncated:      return "deflate stream is truncated";
        case InflateStatus::too_large:      return "inflated body is over the size limit";
        case InflateStatus::trailing_bytes: return "bytes after the deflate stream";
    }
    return "unknown";
}

struct Inflated {
    InflateStatus status{InflateStatus::ok};
    std::vector<std::byte> body;
};

namespace detail {

/// Feed the next slice of input, at most one uInt's worth.
inline void feed(z_stream& stream, std::span<const std::byte> input, std::size_t& offset) {
    if (stream.avail_in != 0 || offset == input.size()) return;
    auto take = std::min<std::size_t>(input.size() - offset, zlib_chunk);
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data() + offset));
    stream.avail_in = static_cast<uInt>(take);
    offset += take;
}

}  // namespace detail

/// Compress a serialized snapshot body.
/// @return false if zlib failed; output is then left empty.
inline auto deflate_snapshot_body(std::span<const std::byte> body, std::vector<std::byte>& output)
    -> bool {
    output.clear();

    auto stream = z_stream{};
    if (::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, raw_window_bits, 8,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    auto chunk = std::array<std::byte, zlib_chunk>{};
    auto offset = std::size_t{0};
    auto ret = Z_OK;
    while (ret != Z_STREAM_END) {
        detail::feed(stream, body, offset);
        const auto flush = offset == body.size() ? Z_FINISH : Z_NO_FLUSH;

        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = ::deflate(&stream, flush);
        if (ret == Z_STREAM_ERROR) break;

        const auto produced = chunk.size() - stream.avail_out;
        output.insert(output.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        output.clear();
        return false;
    }
    return true;
}

/// Inflate a snapshot body, refusing to produce more than limit bytes.
inline auto inflate_snapshot_body(std::span<const std::byte> body, std::size_t limit) -> Inflated {
    auto result = Inflated{};

    auto stream = z_stream{};
    if (::inflateInit2(&stream, raw_window_bits) != Z_OK) {
        result.status = InflateStatus::init_failed;
        return result;
    }

    auto chunk = std::array<std::byte, zlib_chunk>{};
    auto offset = std::size_t{0};
    auto ret = Z_OK;
    while (ret != Z_STREAM_END) {
        detail::feed(stream, body, offset);

        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = ::inflate(&stream, Z_NO_FLUSH);

        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            result.status = InflateStatus::corrupt;
            break;
        }

        const auto produced = chunk.size() - stream.avail_out;
        if (result.body.size() + produced > limit) {
            result.status = InflateStatus::too_large;
            break;
        }
        result.body.insert(result.body.end(), chunk.begin(),
                           chunk.begin() + static_cast<std::ptrdiff_t>(produced));

        // No progress is possible once the input runs out before the final block.
        if (ret == Z_BUF_ERROR) {
            result.status = InflateStatus::truncated;
            break;
        }
    }

    if (result.status == InflateStatus::ok &&
        (stream.avail_in != 0 || offset != body.size())) {
        result.status = InflateStatus::trailing_bytes;
    }
    ::inflateEnd(&stream);

    if (result.status != InflateStatus::ok) result.body.clear();
    return result;
}

}  // namespace campaign_sync::storage
