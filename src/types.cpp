#include <campaign-sync/types.hpp>

#include <cstring>
#include <random>

namespace campaign_sync {

namespace {

auto hex_char_to_nibble(char c) -> std::optional<unsigned> {
    if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<unsigned>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<unsigned>(c - 'A' + 10);
    return std::nullopt;
}

}  // anonymous namespace

auto to_blob(std::string_view text) -> Blob {
    auto blob = Blob(text.size());
    if (!text.empty()) std::memcpy(blob.data(), text.data(), text.size());
    return blob;
}

auto blob_text(std::span<const std::byte> blob) -> std::string {
    return std::string{reinterpret_cast<const char*>(blob.data()), blob.size()};
}

auto ClientId::to_hex() const -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(size * 2);
    for (auto b : bytes) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

auto ClientId::from_hex(std::string_view hex) -> std::optional<ClientId> {
    if (hex.size() != size * 2) return std::nullopt;
    auto id = ClientId{};
    for (std::size_t i = 0; i < size; ++i) {
        auto hi = hex_char_to_nibble(hex[i * 2]);
        auto lo = hex_char_to_nibble(hex[i * 2 + 1]);
        if (!hi || !lo) return std::nullopt;
        id.bytes[i] = static_cast<std::byte>((*hi << 4) | *lo);
    }
    return id;
}

auto ClientId::random() -> ClientId {
    static thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto raw = std::array<std::byte, size>{};
    for (std::size_t i = 0; i < size; i += sizeof(std::uint64_t)) {
        auto word = engine();
        std::memcpy(&raw[i], &word, sizeof(word));
    }
    return ClientId{raw};
}

}  // namespace campaign_sync
