/// @file error.hpp
/// @brief Error types for the campaign-sync library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace campaign_sync {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    storage_write_failure,  ///< Serialization failed or the durable medium rejected a write.
    not_found,              ///< No committed record exists for the requested key.
    queue_flush_rejected,   ///< A queued write was based on a stale revision.
    transport_unavailable,  ///< A notification transport could not be initialized or used.
    snapshot_corrupt,       ///< A stored snapshot or history entry is malformed.
    invalid_config,         ///< A configuration value is missing or out of range.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::storage_write_failure: return "storage_write_failure";
        case ErrorKind::not_found:             return "not_found";
        case ErrorKind::queue_flush_rejected:  return "queue_flush_rejected";
        case ErrorKind::transport_unavailable: return "transport_unavailable";
        case ErrorKind::snapshot_corrupt:      return "snapshot_corrupt";
        case ErrorKind::invalid_config:        return "invalid_config";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying an Error.
///
/// Thrown by operations whose contract says they "fail" (DurableStore::put,
/// OfflineQueue::flush, RemoteConnector::connect, load_config). Absence of a
/// value is reported with std::optional instead.
class Failure : public std::runtime_error {
public:
    explicit Failure(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    Failure(ErrorKind kind, std::string message)
        : Failure{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace campaign_sync
