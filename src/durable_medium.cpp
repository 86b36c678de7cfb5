#include <campaign-sync/durable_medium.hpp>
#include <campaign-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace campaign_sync {

struct MemoryStorage::Shared {
    std::map<std::string, Blob, std::less<>> data;
    std::size_t quota = 0;
    std::function<bool(std::string_view)> fail_when;
    std::vector<MemoryMedium*> views;

    auto used() const -> std::size_t {
        auto total = std::size_t{0};
        for (const auto& [key, value] : data) total += key.size() + value.size();
        return total;
    }
};

// -- MemoryStorage ------------------------------------------------------------

MemoryStorage::MemoryStorage(std::size_t quota_bytes)
    : shared_{std::make_shared<Shared>()} {
    shared_->quota = quota_bytes;
}

MemoryStorage::~MemoryStorage() = default;

auto MemoryStorage::open() -> std::unique_ptr<MemoryMedium> {
    return std::make_unique<MemoryMedium>(shared_);
}

void MemoryStorage::set_quota(std::size_t quota_bytes) {
    shared_->quota = quota_bytes;
}

void MemoryStorage::fail_writes_when(std::function<bool(std::string_view key)> predicate) {
    shared_->fail_when = std::move(predicate);
}

auto MemoryStorage::used_bytes() const -> std::size_t {
    return shared_->used();
}

auto MemoryStorage::peek(std::string_view key) const -> std::optional<Blob> {
    auto it = shared_->data.find(key);
    if (it == shared_->data.end()) return std::nullopt;
    return it->second;
}

void MemoryStorage::poke(std::string_view key, Blob value) {
    shared_->data.insert_or_assign(std::string{key}, std::move(value));
}

// -- MemoryMedium -------------------------------------------------------------

MemoryMedium::MemoryMedium(std::shared_ptr<MemoryStorage::Shared> shared)
    : shared_{std::move(shared)} {
    shared_->views.push_back(this);
}

MemoryMedium::~MemoryMedium() {
    std::erase(shared_->views, this);
}

auto MemoryMedium::read(std::string_view key) const -> std::optional<Blob> {
    auto it = shared_->data.find(key);
    if (it == shared_->data.end()) return std::nullopt;
    return it->second;
}

void MemoryMedium::write(std::string_view key, std::span<const std::byte> value) {
    if (shared_->fail_when && shared_->fail_when(key)) {
        throw Failure{ErrorKind::storage_write_failure,
                      "write to '" + std::string{key} + "' rejected by medium"};
    }

    if (shared_->quota != 0) {
        auto used = shared_->used();
        if (auto it = shared_->data.find(key); it != shared_->data.end()) {
            used -= it->first.size() + it->second.size();
        }
        if (used + key.size() + value.size() > shared_->quota) {
            throw Failure{ErrorKind::storage_write_failure,
                          "quota exceeded writing '" + std::string{key} + "'"};
        }
    }

    shared_->data.insert_or_assign(std::string{key}, Blob(value.begin(), value.end()));
    notify_others(key);
}

void MemoryMedium::remove(std::string_view key) {
    auto it = shared_->data.find(key);
    if (it == shared_->data.end()) return;
    shared_->data.erase(it);
    notify_others(key);
}

void MemoryMedium::on_external_change(ChangeHandler handler) {
    handlers_.push_back(std::move(handler));
}

void MemoryMedium::notify_others(std::string_view key) {
    // Handlers may open or close views; iterate over a copy.
    auto views = shared_->views;
    for (auto* view : views) {
        if (view == this) continue;
        for (const auto& handler : view->handlers_) {
            handler(key);
        }
    }
}

// -- FileMedium ---------------------------------------------------------------

FileMedium::FileMedium(std::filesystem::path directory)
    : directory_{std::move(directory)} {
    auto ec = std::error_code{};
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw Failure{ErrorKind::storage_write_failure,
                      "cannot create " + directory_.string() + ": " + ec.message()};
    }
}

auto FileMedium::path_for(std::string_view key) const -> std::filesystem::path {
    // Keys contain '/' (user scoping); flatten to a single file name.
    auto name = std::string{};
    name.reserve(key.size());
    for (auto c : key) {
        if (c == '/' || c == '\\' || c == ':') {
            name += '_';
        } else {
            name += c;
        }
    }
    return directory_ / (name + ".blob");
}

auto FileMedium::read(std::string_view key) const -> std::optional<Blob> {
    auto in = std::ifstream{path_for(key), std::ios::binary};
    if (!in) return std::nullopt;
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    auto blob = Blob(chars.size());
    std::transform(chars.begin(), chars.end(), blob.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return blob;
}

void FileMedium::write(std::string_view key, std::span<const std::byte> value) {
    const auto target = path_for(key);
    auto temp = target;
    temp += ".tmp";

    {
        auto out = std::ofstream{temp, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw Failure{ErrorKind::storage_write_failure, "cannot open " + temp.string()};
        }
        out.write(reinterpret_cast<const char*>(value.data()),
                  static_cast<std::streamsize>(value.size()));
        out.flush();
        if (!out) {
            throw Failure{ErrorKind::storage_write_failure, "short write to " + temp.string()};
        }
    }

    auto ec = std::error_code{};
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw Failure{ErrorKind::storage_write_failure,
                      "cannot replace " + target.string()};
    }
}

void FileMedium::remove(std::string_view key) {
    auto ec = std::error_code{};
    std::filesystem::remove(path_for(key), ec);
    if (ec) {
        SPDLOG_WARN("cannot remove {}: {}", path_for(key).string(), ec.message());
    }
}

}  // namespace campaign_sync
