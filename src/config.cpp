#include <campaign-sync/config.hpp>
#include <campaign-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <fstream>
#include <utility>

namespace campaign_sync {

namespace {

auto invalid(std::string message) -> Failure {
    return Failure{ErrorKind::invalid_config, std::move(message)};
}

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw invalid(std::string{"'"} + key + "': " + e.what());
    }
}

void read_capacity(const nlohmann::json& j, const char* key, std::size_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
        throw invalid(std::string{"'"} + key + "' must be a positive integer");
    }
    out = static_cast<std::size_t>(it->get<std::int64_t>());
}

constexpr auto log_levels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

auto known_log_level(std::string_view name) -> bool {
    for (auto level : log_levels) {
        if (level == name) return true;
    }
    return false;
}

}  // namespace

auto load_config(const nlohmann::json& j) -> SyncConfig {
    if (!j.is_object()) throw invalid("configuration must be a JSON object");

    auto config = SyncConfig{};
    read_field(j, "user", config.user);
    read_field(j, "actorLabel", config.actor_label);
    read_field(j, "actorRole", config.actor_role);
    read_capacity(j, "queueCapacity", config.queue_capacity);
    read_capacity(j, "deflateThreshold", config.deflate_threshold);
    read_field(j, "logLevel", config.log_level);
    read_field(j, "storageDirectory", config.storage_directory);

    if (auto it = j.find("history"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw invalid("'history' must be an object");
        read_capacity(*it, "campaign", config.history.campaign);
        read_capacity(*it, "relationship", config.history.relationship);
        read_capacity(*it, "section", config.history.section);
    }

    if (auto it = j.find("remote"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw invalid("'remote' must be an object");
        auto remote = RemoteConfig{};
        read_field(*it, "endpoint", remote.endpoint);
        read_field(*it, "channel", remote.channel);
        read_field(*it, "apiKey", remote.api_key);
        read_field(*it, "connectTimeoutMs", remote.connect_timeout_ms);
        if (remote.endpoint.empty()) throw invalid("'remote.endpoint' is required");
        if (remote.channel.empty()) remote.channel = config.user;
        config.remote = std::move(remote);
    }

    if (config.user.empty()) throw invalid("'user' must not be empty");
    if (config.actor_role != "gm" && config.actor_role != "player") {
        throw invalid("'actorRole' must be \"gm\" or \"player\", got \"" + config.actor_role + "\"");
    }
    if (!known_log_level(config.log_level)) {
        throw invalid("unknown 'logLevel' \"" + config.log_level + "\"");
    }
    return config;
}

auto load_config_file(const std::filesystem::path& path) -> SyncConfig {
    auto in = std::ifstream{path};
    if (!in) throw invalid("cannot open " + path.string());

    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) throw invalid(path.string() + " is not valid JSON");

    auto config = load_config(j);
    SPDLOG_INFO("loaded configuration for '{}' from {}", config.user, path.string());
    return config;
}

auto config_json(const SyncConfig& config) -> nlohmann::json {
    auto j = nlohmann::json{
        {"user", config.user},
        {"actorLabel", config.actor_label},
        {"actorRole", config.actor_role},
        {"history", {
            {"campaign", config.history.campaign},
            {"relationship", config.history.relationship},
            {"section", config.history.section},
        }},
        {"queueCapacity", config.queue_capacity},
        {"deflateThreshold", config.deflate_threshold},
        {"logLevel", config.log_level},
        {"storageDirectory", config.storage_directory},
    };
    if (config.remote) {
        j["remote"] = {
            {"endpoint", config.remote->endpoint},
            {"channel", config.remote->channel},
            {"apiKey", config.remote->api_key},
            {"connectTimeoutMs", config.remote->connect_timeout_ms},
        };
    }
    return j;
}

void configure_logging(std::string_view level) {
    if (!known_log_level(level)) {
        throw invalid("unknown log level \"" + std::string{level} + "\"");
    }
    spdlog::set_level(spdlog::level::from_str(std::string{level}));
}

}  // namespace campaign_sync
