/// @file notifier.hpp
/// @brief Notifier: announces commits to other contexts and delivers theirs.

#pragma once

#include <campaign-sync/notification.hpp>
#include <campaign-sync/revision_clock.hpp>
#include <campaign-sync/session.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace campaign_sync {

// -- Transports ---------------------------------------------------------------

/// A channel carrying serialized notifications between contexts.
class Transport {
public:
    using ReceiveHandler = std::function<void(std::string_view text)>;

    virtual ~Transport() = default;

    /// Deliver text to the other ends of the channel.
    /// @throws Failure (transport_unavailable) if the channel is broken.
    virtual void send(std::string_view text) = 0;

    /// Register the handler for text arriving from other ends.
    virtual void on_receive(ReceiveHandler handler) = 0;

    /// Short name for logs and diagnostics.
    virtual auto name() const -> std::string_view = 0;
};

class LocalTransport;

/// Same-device broadcast channel, like one browser profile's
/// BroadcastChannel shared by its tabs.
///
/// Delivery is synchronous and reaches every attached transport except the
/// sender.
class LocalBus {
public:
    LocalBus();
    ~LocalBus();

    LocalBus(const LocalBus&) = delete;
    auto operator=(const LocalBus&) -> LocalBus& = delete;

    /// Attach a new endpoint to this bus.
    auto attach() -> std::unique_ptr<LocalTransport>;

    /// Number of endpoints currently attached.
    auto attached() const -> std::size_t;

    struct Shared;

private:
    std::shared_ptr<Shared> shared_;
};

/// One endpoint of a LocalBus.
class LocalTransport : public Transport {
public:
    explicit LocalTransport(std::shared_ptr<LocalBus::Shared> shared);
    ~LocalTransport() override;

    LocalTransport(const LocalTransport&) = delete;
    auto operator=(const LocalTransport&) -> LocalTransport& = delete;

    void send(std::string_view text) override;
    void on_receive(ReceiveHandler handler) override;
    auto name() const -> std::string_view override { return "local"; }

private:
    std::shared_ptr<LocalBus::Shared> shared_;
    std::vector<ReceiveHandler> handlers_;
};

/// Settings for a remote (cross-device) transport.
struct RemoteConfig {
    std::string endpoint;    ///< Relay URL.
    std::string channel;     ///< Channel or room name; defaults to the user id.
    std::string api_key;     ///< Credential presented to the relay.
    std::uint32_t connect_timeout_ms{5000};

    auto operator==(const RemoteConfig&) const -> bool = default;
};

/// Factory for remote transports.
class RemoteConnector {
public:
    virtual ~RemoteConnector() = default;

    /// Open a remote channel.
    /// @throws Failure (transport_unavailable) if it cannot be opened.
    virtual auto connect(const RemoteConfig& config) -> std::unique_ptr<Transport> = 0;
};

// -- Notifier -----------------------------------------------------------------

/// Publishes write-committed events and delivers the ones other contexts
/// publish.
///
/// The local transport is always kept as a fallback. A remote transport
/// that fails to connect, or later fails to send, is dropped in favour of
/// the local one and the reason is kept for diagnostics; callers never see
/// the failure.
///
/// Incoming messages are dropped when they are malformed, of an unknown
/// type, sent by this context (same client id) or about the revision this
/// context already knows.
class Notifier {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    Notifier(SessionContext& session, std::unique_ptr<Transport> local,
             TimeSource now = system_time);

    Notifier(const Notifier&) = delete;
    auto operator=(const Notifier&) -> Notifier& = delete;

    /// Broadcast an event. Never throws.
    void announce(const Event& event);

    auto subscribe(Handler handler) -> SubscriptionId;
    void unsubscribe(SubscriptionId id);

    /// Make transport the active channel. Passing nullptr returns to the
    /// local transport.
    void set_transport(std::unique_ptr<Transport> transport);

    /// Try to switch to a remote transport.
    /// @return true if the remote transport is now active; false if it
    ///   could not be opened and the local transport stays active.
    auto enable_remote(RemoteConnector& connector, const RemoteConfig& config) -> bool;

    /// Name of the transport announcements currently go out on.
    auto transport_name() const -> std::string_view;

    /// Why the last remote transport was abandoned, if it was.
    auto downgrade_reason() const -> const std::optional<std::string>& { return downgrade_reason_; }

private:
    void receive(std::string_view text);
    void downgrade(std::string reason);

    SessionContext& session_;
    TimeSource now_;
    std::unique_ptr<Transport> local_;
    std::unique_ptr<Transport> remote_;
    std::optional<std::string> downgrade_reason_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_{1};
};

}  // namespace campaign_sync
