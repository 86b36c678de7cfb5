// offline_replay: edits made offline survive a restart and replay on reconnect
//
// Usage: offline_replay [config.json]
//
// With a config naming a storageDirectory the campaigns live in files there;
// otherwise a temporary directory is used.

#include <campaign-sync/campaign_sync.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

namespace cs = campaign_sync;

int main(int argc, char** argv) {
    auto config = cs::SyncConfig{};
    try {
        if (argc > 1) config = cs::load_config_file(argv[1]);
        cs::configure_logging(config.log_level);
    } catch (const cs::Failure& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    auto directory = std::filesystem::path{config.storage_directory};
    if (directory.empty()) {
        directory = std::filesystem::temp_directory_path() / "campaign-sync-offline-replay";
        std::filesystem::remove_all(directory);
    }
    std::printf("Storing campaigns in %s\n", directory.string().c_str());

    auto medium = cs::FileMedium{directory};
    auto bus = cs::LocalBus{};

    // --- Session 1: go offline and keep playing ---
    {
        auto ctl = cs::SyncController{config, medium, bus.attach()};
        ctl.open();
        ctl.add_entity(cs::Entity{.id = "pc-1", .kind = cs::EntityKind::pc, .name = "Ash"});
        std::printf("Committed revision: %s\n", ctl.session().known_revision.value.c_str());

        ctl.set_online(false);
        for (int i = 1; i <= 3; ++i) {
            auto outcome = ctl.apply_stress("pc-1", cs::StressTrack::blood, 2);
            std::printf("Offline stress %d: %s\n", i,
                        std::string{cs::to_string_view(outcome.save)}.c_str());
        }
        std::printf("Queued writes: %zu (%s)\n", ctl.queue().size(), ctl.indicator().message.c_str());
    }

    // --- Session 2: restart and replay ---
    auto ctl = cs::SyncController{config, medium, bus.attach()};
    ctl.open();
    std::printf("\nAfter restart, queued writes: %zu\n", ctl.queue().size());

    auto outcome = ctl.retry();
    std::printf("Replaying queued writes: %s\n", std::string{cs::to_string_view(outcome)}.c_str());

    auto stored = ctl.store().get(config.user);
    if (!stored) {
        std::fprintf(stderr, "nothing stored for %s\n", config.user.c_str());
        return 1;
    }
    const auto* ash = stored->campaigns.active()->find_entity("pc-1");
    std::printf("Durable blood stress: %d, fallout taken: %zu\n",
                ash ? ash->stress_on(cs::StressTrack::blood) : 0, ash ? ash->fallout.size() : 0);
    std::printf("Durable revision: %s\n", stored->revision.value.c_str());

    if (auto backup = ctl.store().load_backup(config.user)) {
        std::printf("Backup saved at %lld\n", static_cast<long long>(backup->saved_at));
    }
    return 0;
}
