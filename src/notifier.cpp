#include <campaign-sync/notifier.hpp>
#include <campaign-sync/error.hpp>
#include <campaign-sync/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace campaign_sync {

struct LocalBus::Shared {
    std::vector<LocalTransport*> endpoints;
};

// -- LocalBus -----------------------------------------------------------------

LocalBus::LocalBus() : shared_{std::make_shared<Shared>()} {}

LocalBus::~LocalBus() = default;

auto LocalBus::attach() -> std::unique_ptr<LocalTransport> {
    return std::make_unique<LocalTransport>(shared_);
}

auto LocalBus::attached() const -> std::size_t {
    return shared_->endpoints.size();
}

// -- LocalTransport -----------------------------------------------------------

LocalTransport::LocalTransport(std::shared_ptr<LocalBus::Shared> shared)
    : shared_{std::move(shared)} {
    shared_->endpoints.push_back(this);
}

LocalTransport::~LocalTransport() {
    std::erase(shared_->endpoints, this);
}

void LocalTransport::send(std::string_view text) {
    // Receivers may attach or detach endpoints while handling.
    auto endpoints = shared_->endpoints;
    for (auto* endpoint : endpoints) {
        if (endpoint == this) continue;
        if (std::ranges::find(shared_->endpoints, endpoint) == shared_->endpoints.end()) continue;
        for (const auto& handler : endpoint->handlers_) {
            handler(text);
        }
    }
}

void LocalTransport::on_receive(ReceiveHandler handler) {
    handlers_.push_back(std::move(handler));
}

// -- Notifier -----------------------------------------------------------------

Notifier::Notifier(SessionContext& session, std::unique_ptr<Transport> local, TimeSource now)
    : session_{session}, now_{std::move(now)}, local_{std::move(local)} {
    if (local_) {
        local_->on_receive([this](std::string_view text) { receive(text); });
    }
}

void Notifier::announce(const Event& event) {
    auto msg = NotificationMessage{
        .type = std::string{campaign_saved_type},
        .revision = event.revision,
        .campaign_id = event.campaign_id,
        .actor = event.actor_label,
        .actor_role = event.actor_role,
        .client_id = session_.client_id,
        .time = now_(),
    };
    const auto text = encode_message(msg);

    if (remote_) {
        try {
            remote_->send(text);
            return;
        } catch (const std::exception& e) {
            downgrade(e.what());
        }
    }

    if (!local_) return;
    try {
        local_->send(text);
    } catch (const std::exception& e) {
        SPDLOG_ERROR("could not announce revision {}: {}", event.revision.value, e.what());
    }
}

auto Notifier::subscribe(Handler handler) -> SubscriptionId {
    auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void Notifier::unsubscribe(SubscriptionId id) {
    handlers_.erase(id);
}

void Notifier::set_transport(std::unique_ptr<Transport> transport) {
    remote_ = std::move(transport);
    if (remote_) {
        remote_->on_receive([this](std::string_view text) { receive(text); });
        SPDLOG_INFO("notifications now use the {} transport", remote_->name());
    }
}

auto Notifier::enable_remote(RemoteConnector& connector, const RemoteConfig& config) -> bool {
    try {
        set_transport(connector.connect(config));
    } catch (const std::exception& e) {
        downgrade(e.what());
        return false;
    }
    if (!remote_) {
        downgrade("connector returned no transport");
        return false;
    }
    downgrade_reason_.reset();
    return true;
}

auto Notifier::transport_name() const -> std::string_view {
    if (remote_) return remote_->name();
    if (local_) return local_->name();
    return "none";
}

void Notifier::receive(std::string_view text) {
    auto msg = decode_message(text);
    if (!msg) return;
    if (msg->type != campaign_saved_type) {
        SPDLOG_DEBUG("ignoring notification of type '{}'", msg->type);
        return;
    }
    if (msg->client_id == session_.client_id) return;
    if (msg->revision == session_.known_revision) return;

    auto event = Event{
        .kind = EventKind::write_committed,
        .revision = std::move(msg->revision),
        .campaign_id = std::move(msg->campaign_id),
        .actor_label = std::move(msg->actor),
        .actor_role = std::move(msg->actor_role),
    };
    SPDLOG_DEBUG("{} ({}) committed revision {}", event.actor_label, event.actor_role, event.revision.value);

    auto handlers = handlers_;
    for (const auto& [id, handler] : handlers) {
        handler(event);
    }
}

void Notifier::downgrade(std::string reason) {
    SPDLOG_WARN("remote notifications unavailable, falling back to local: {}", reason);
    remote_.reset();
    downgrade_reason_ = std::move(reason);
}

}  // namespace campaign_sync
