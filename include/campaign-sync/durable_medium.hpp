/// @file durable_medium.hpp
/// @brief DurableMedium: the key/value storage DurableStore writes through.

#pragma once

#include <campaign-sync/types.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace campaign_sync {

/// Abstract durable key/value medium.
///
/// Implementations report write failures (quota, I/O) by throwing
/// Failure with ErrorKind::storage_write_failure.
class DurableMedium {
public:
    virtual ~DurableMedium() = default;

    /// Read the value stored under key, or nullopt if there is none.
    virtual auto read(std::string_view key) const -> std::optional<Blob> = 0;

    /// Store value under key, replacing any previous value.
    virtual void write(std::string_view key, std::span<const std::byte> value) = 0;

    /// Remove key. Removing a missing key is not an error.
    virtual void remove(std::string_view key) = 0;
};

/// Called with the key that another context changed.
using ChangeHandler = std::function<void(std::string_view key)>;

class MemoryMedium;

/// In-process storage shared by several contexts, like one browser
/// profile's local storage shared by its tabs.
///
/// Each context opens its own MemoryMedium view. A write through one view
/// raises change events on every other view, never on the writer.
///
/// @code
/// auto storage = MemoryStorage{};
/// auto tab_a = storage.open();
/// auto tab_b = storage.open();
/// tab_b->on_external_change([](std::string_view key) { ... });
/// tab_a->write("k", to_blob("v"));   // tab_b's handler runs
/// @endcode
class MemoryStorage {
public:
    /// @param quota_bytes Total bytes across all keys; 0 = unlimited.
    explicit MemoryStorage(std::size_t quota_bytes = 0);
    ~MemoryStorage();

    MemoryStorage(const MemoryStorage&) = delete;
    auto operator=(const MemoryStorage&) -> MemoryStorage& = delete;

    /// Open a new view onto this storage.
    auto open() -> std::unique_ptr<MemoryMedium>;

    /// Change the quota (0 = unlimited).
    void set_quota(std::size_t quota_bytes);

    /// Make writes fail while predicate(key) returns true. Pass an empty
    /// function to stop failing.
    void fail_writes_when(std::function<bool(std::string_view key)> predicate);

    /// Total bytes currently stored.
    auto used_bytes() const -> std::size_t;

    /// Read a key without going through a view.
    auto peek(std::string_view key) const -> std::optional<Blob>;

    /// Overwrite a key without raising change events (simulates damage).
    void poke(std::string_view key, Blob value);

    struct Shared;

private:
    std::shared_ptr<Shared> shared_;
};

/// One context's view of a MemoryStorage.
class MemoryMedium : public DurableMedium {
public:
    explicit MemoryMedium(std::shared_ptr<MemoryStorage::Shared> shared);
    ~MemoryMedium() override;

    MemoryMedium(const MemoryMedium&) = delete;
    auto operator=(const MemoryMedium&) -> MemoryMedium& = delete;

    auto read(std::string_view key) const -> std::optional<Blob> override;
    void write(std::string_view key, std::span<const std::byte> value) override;
    void remove(std::string_view key) override;

    /// Register a handler for writes made through other views.
    void on_external_change(ChangeHandler handler);

private:
    friend class MemoryStorage;

    void notify_others(std::string_view key);

    std::shared_ptr<MemoryStorage::Shared> shared_;
    std::vector<ChangeHandler> handlers_;
};

/// A medium keeping one file per key in a directory.
///
/// Writes go to a temporary file that is then renamed over the target, so
/// a reader never sees a half-written value.
class FileMedium : public DurableMedium {
public:
    /// @param directory Created if it does not exist.
    /// @throws Failure (storage_write_failure) if the directory cannot be created.
    explicit FileMedium(std::filesystem::path directory);

    auto read(std::string_view key) const -> std::optional<Blob> override;
    void write(std::string_view key, std::span<const std::byte> value) override;
    void remove(std::string_view key) override;

    auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    auto path_for(std::string_view key) const -> std::filesystem::path;

    std::filesystem::path directory_;
};

}  // namespace campaign_sync
