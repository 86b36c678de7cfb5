/// @file revision_clock.hpp
/// @brief RevisionClock: generates and compares revision tokens.

#pragma once

#include <campaign-sync/types.hpp>

#include <cstdint>
#include <functional>
#include <random>

namespace campaign_sync {

/// Result of comparing two revision tokens. Tokens carry no order.
enum class Comparison : std::uint8_t {
    equal,
    different,
};

/// A source of wall-clock milliseconds.
using TimeSource = std::function<Millis()>;

/// The system clock as a TimeSource.
auto system_time() -> Millis;

/// Produces revision tokens of the form `<millis>-<sequence>-<random hex>`.
///
/// The sequence makes every token from one clock distinct even when the
/// time source does not advance; the 64 random bits make tokens from
/// different clocks distinct with overwhelming probability.
class RevisionClock {
public:
    /// Clock seeded from std::random_device and reading the system time.
    RevisionClock();

    /// Clock with an explicit time source and seed (deterministic in tests).
    RevisionClock(TimeSource now, std::uint64_t seed);

    /// Generate a fresh token.
    auto next() -> RevisionToken;

    /// Equality comparison; the only relation tokens support.
    static auto compare(const RevisionToken& a, const RevisionToken& b) -> Comparison {
        return a == b ? Comparison::equal : Comparison::different;
    }

    /// Current time from this clock's time source.
    auto now() const -> Millis { return now_(); }

private:
    TimeSource now_;
    std::mt19937_64 engine_;
    std::uint64_t sequence_ = 0;
};

}  // namespace campaign_sync
