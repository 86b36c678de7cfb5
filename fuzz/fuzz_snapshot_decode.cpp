// Fuzz target for stored campaign blobs. Exercises the envelope check,
// inflate and the JSON model decoder.

#include <campaign-sync/snapshot_codec.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    // Threshold 1 so re-encoding also takes the deflate path
    const auto codec = campaign_sync::SnapshotCodec{1};
    if (auto set = codec.decode(span)) {
        auto blob = codec.encode(*set);
        (void)blob;
    }

    return 0;
}
