// Fuzz target for notification and pending-ops parsing.

#include <campaign-sync/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    auto msg = campaign_sync::decode_message(text);
    (void)msg;

    auto ops = campaign_sync::decode_queue(text);
    (void)ops;

    return 0;
}
