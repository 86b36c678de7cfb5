#include <campaign-sync/revision_clock.hpp>

#include <chrono>
#include <cstdio>
#include <string>
#include <utility>

namespace campaign_sync {

auto system_time() -> Millis {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

RevisionClock::RevisionClock()
    : now_{system_time},
      engine_{std::random_device{}()} {}

RevisionClock::RevisionClock(TimeSource now, std::uint64_t seed)
    : now_{std::move(now)},
      engine_{seed} {}

auto RevisionClock::next() -> RevisionToken {
    char suffix[17];
    std::snprintf(suffix, sizeof(suffix), "%016llx",
                  static_cast<unsigned long long>(engine_()));
    ++sequence_;
    return RevisionToken{std::to_string(now_()) + "-" + std::to_string(sequence_) + "-" + suffix};
}

}  // namespace campaign_sync
