#include <campaign-sync/json.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace campaign_sync {

namespace {

template <typename Enum, typename Parse>
auto parse_enum(const nlohmann::json& j, Parse parse, const char* what) -> Enum {
    auto parsed = parse(j.get<std::string>());
    if (!parsed) {
        throw std::runtime_error{std::string{"unknown "} + what + ": " + j.get<std::string>()};
    }
    return *parsed;
}

}  // anonymous namespace

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const ClientId& id) {
    j = id.to_hex();
}

void from_json(const nlohmann::json& j, ClientId& id) {
    auto parsed = ClientId::from_hex(j.get<std::string>());
    if (!parsed) throw std::runtime_error{"invalid client id"};
    id = *parsed;
}

void to_json(nlohmann::json& j, const RevisionToken& token) {
    j = token.value;
}

void from_json(const nlohmann::json& j, RevisionToken& token) {
    token.value = j.is_null() ? std::string{} : j.get<std::string>();
}

// -- Enums --------------------------------------------------------------------

void to_json(nlohmann::json& j, EntityKind kind) { j = std::string{to_string_view(kind)}; }
void from_json(const nlohmann::json& j, EntityKind& kind) {
    kind = parse_enum<EntityKind>(j, parse_entity_kind, "entity kind");
}

void to_json(nlohmann::json& j, StressTrack track) { j = std::string{to_string_view(track)}; }
void from_json(const nlohmann::json& j, StressTrack& track) {
    track = parse_enum<StressTrack>(j, parse_stress_track, "stress track");
}

void to_json(nlohmann::json& j, Severity severity) { j = std::string{to_string_view(severity)}; }
void from_json(const nlohmann::json& j, Severity& severity) {
    severity = parse_enum<Severity>(j, parse_severity, "severity");
}

void to_json(nlohmann::json& j, OperationKind kind) { j = std::string{to_string_view(kind)}; }
void from_json(const nlohmann::json& j, OperationKind& kind) {
    kind = parse_enum<OperationKind>(j, parse_operation_kind, "operation kind");
}

// -- Campaign model -----------------------------------------------------------

void to_json(nlohmann::json& j, const SectionItem& item) {
    j = nlohmann::json{{"id", item.id}, {"text", item.text}, {"done", item.done}};
}

void from_json(const nlohmann::json& j, SectionItem& item) {
    item.id = j.at("id").get<std::string>();
    item.text = j.value("text", std::string{});
    item.done = j.value("done", false);
}

void to_json(nlohmann::json& j, const Fallout& f) {
    j = nlohmann::json{
        {"id", f.id},
        {"track", f.track},
        {"severity", f.severity},
        {"createdAt", f.created_at},
    };
}

void from_json(const nlohmann::json& j, Fallout& f) {
    f.id = j.at("id").get<std::string>();
    f.track = j.at("track").get<StressTrack>();
    f.severity = j.at("severity").get<Severity>();
    f.created_at = j.value("createdAt", Millis{0});
}

void to_json(nlohmann::json& j, const Entity& e) {
    auto stress = nlohmann::json::object();
    for (const auto& [track, filled] : e.stress) {
        stress[std::string{to_string_view(track)}] = filled;
    }
    j = nlohmann::json{
        {"id", e.id},
        {"kind", e.kind},
        {"name", e.name},
        {"fields", e.fields},
        {"tasks", e.tasks},
        {"inventory", e.inventory},
        {"bonds", e.bonds},
        {"stress", std::move(stress)},
        {"fallout", e.fallout},
    };
}

void from_json(const nlohmann::json& j, Entity& e) {
    e.id = j.at("id").get<std::string>();
    e.kind = j.at("kind").get<EntityKind>();
    e.name = j.value("name", std::string{});
    e.fields = j.value("fields", std::map<std::string, std::string>{});
    e.tasks = j.value("tasks", Section{});
    e.inventory = j.value("inventory", Section{});
    e.bonds = j.value("bonds", Section{});
    e.stress.clear();
    if (auto it = j.find("stress"); it != j.end()) {
        for (const auto& [name, filled] : it->items()) {
            auto track = parse_stress_track(name);
            if (!track) throw std::runtime_error{"unknown stress track: " + name};
            e.stress[*track] = filled.get<int>();
        }
    }
    e.fallout = j.value("fallout", std::vector<Fallout>{});
}

void to_json(nlohmann::json& j, const Relationship& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"from", r.from_id},
        {"to", r.to_id},
        {"label", r.label},
        {"notes", r.notes},
        {"strength", r.strength},
    };
}

void from_json(const nlohmann::json& j, Relationship& r) {
    r.id = j.at("id").get<std::string>();
    r.from_id = j.at("from").get<std::string>();
    r.to_id = j.at("to").get<std::string>();
    r.label = j.value("label", std::string{});
    r.notes = j.value("notes", std::string{});
    r.strength = j.value("strength", 0);
}

void to_json(nlohmann::json& j, const CustomRules& rules) {
    j = nlohmann::json::object();
    if (rules.difficulty_downgrades) j["difficultyDowngrades"] = *rules.difficulty_downgrades;
    if (rules.fallout_check_on_stress) j["falloutCheckOnStress"] = *rules.fallout_check_on_stress;
    if (rules.clear_stress_on_fallout) j["clearStressOnFallout"] = *rules.clear_stress_on_fallout;
}

void from_json(const nlohmann::json& j, CustomRules& rules) {
    auto read = [&](const char* key) -> std::optional<bool> {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        return it->get<bool>();
    };
    rules.difficulty_downgrades = read("difficultyDowngrades");
    rules.fallout_check_on_stress = read("falloutCheckOnStress");
    rules.clear_stress_on_fallout = read("clearStressOnFallout");
}

void to_json(nlohmann::json& j, const Settings& s) {
    j = nlohmann::json{{"rulesProfile", s.rules_profile}, {"customRules", s.custom_rules}};
}

void from_json(const nlohmann::json& j, Settings& s) {
    s.rules_profile = j.value("rulesProfile", std::string{"Core"});
    s.custom_rules = j.value("customRules", CustomRules{});
}

void to_json(nlohmann::json& j, const LogEntry& entry) {
    j = nlohmann::json{{"at", entry.at}, {"text", entry.text}};
}

void from_json(const nlohmann::json& j, LogEntry& entry) {
    entry.at = j.value("at", Millis{0});
    entry.text = j.value("text", std::string{});
}

void to_json(nlohmann::json& j, const Campaign& c) {
    j = nlohmann::json{
        {"id", c.id},
        {"name", c.name},
        {"entities", c.entities},
        {"relationships", c.relationships},
        {"settings", c.settings},
        {"log", c.log},
    };
}

void from_json(const nlohmann::json& j, Campaign& c) {
    c.id = j.at("id").get<std::string>();
    c.name = j.value("name", std::string{});
    c.entities = j.value("entities", std::map<std::string, Entity>{});
    c.relationships = j.value("relationships", std::map<std::string, Relationship>{});
    c.settings = j.value("settings", Settings{});
    c.log = j.value("log", std::vector<LogEntry>{});
}

void to_json(nlohmann::json& j, const CampaignSet& set) {
    j = nlohmann::json{
        {"campaigns", set.campaigns},
        {"activeCampaignId", set.active_campaign_id},
    };
}

void from_json(const nlohmann::json& j, CampaignSet& set) {
    set.campaigns = j.at("campaigns").get<std::map<std::string, Campaign>>();
    set.active_campaign_id = j.value("activeCampaignId", std::string{});
}

// -- Queue and wire records ---------------------------------------------------

void to_json(nlohmann::json& j, const PendingOperation& op) {
    j = nlohmann::json{
        {"id", op.id},
        {"createdAt", op.created_at},
        {"kind", op.kind},
        {"baseRevision", op.base_revision},
        {"campaignId", op.campaign_id},
        {"payload", op.payload},
    };
}

void from_json(const nlohmann::json& j, PendingOperation& op) {
    op.id = j.at("id").get<std::string>();
    op.created_at = j.value("createdAt", Millis{0});
    op.kind = j.at("kind").get<OperationKind>();
    op.base_revision = j.value("baseRevision", RevisionToken{});
    op.campaign_id = j.value("campaignId", std::string{});
    op.payload = j.at("payload").get<CampaignSet>();
}

void to_json(nlohmann::json& j, const NotificationMessage& msg) {
    j = nlohmann::json{
        {"type", msg.type},
        {"revision", msg.revision},
        {"campaignId", msg.campaign_id},
        {"actor", msg.actor},
        {"actorRole", msg.actor_role},
        {"clientId", msg.client_id},
        {"time", msg.time},
    };
}

void from_json(const nlohmann::json& j, NotificationMessage& msg) {
    msg.type = j.at("type").get<std::string>();
    msg.revision = j.value("revision", RevisionToken{});
    msg.campaign_id = j.value("campaignId", std::string{});
    msg.actor = j.value("actor", std::string{});
    msg.actor_role = j.value("actorRole", std::string{});
    msg.client_id = j.at("clientId").get<ClientId>();
    msg.time = j.value("time", Millis{0});
}

// -- Text helpers -------------------------------------------------------------

auto encode_message(const NotificationMessage& msg) -> std::string {
    return nlohmann::json(msg).dump();
}

auto decode_message(std::string_view text) -> std::optional<NotificationMessage> {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    try {
        return j.get<NotificationMessage>();
    } catch (const nlohmann::json::exception& e) {
        SPDLOG_DEBUG("dropping malformed notification: {}", e.what());
    } catch (const std::runtime_error& e) {
        SPDLOG_DEBUG("dropping malformed notification: {}", e.what());
    }
    return std::nullopt;
}

auto encode_queue(const std::vector<PendingOperation>& ops) -> std::string {
    return nlohmann::json(ops).dump();
}

auto decode_queue(std::string_view text) -> std::optional<std::vector<PendingOperation>> {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) return std::nullopt;
    try {
        return j.get<std::vector<PendingOperation>>();
    } catch (const nlohmann::json::exception& e) {
        SPDLOG_WARN("persisted pending-ops queue is malformed: {}", e.what());
    } catch (const std::runtime_error& e) {
        SPDLOG_WARN("persisted pending-ops queue is malformed: {}", e.what());
    }
    return std::nullopt;
}

}  // namespace campaign_sync
