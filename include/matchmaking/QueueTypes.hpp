#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "core/Types.hpp"

namespace caro::matchmaking {

using core::PlayerId;
using core::TimePoint;

enum class EntryStatus : std::uint8_t {
    Waiting,
    Matched,
    Expired
};

struct QueueEntry {
    PlayerId playerId{};
    std::string username;
    int rating{};
    TimePoint joinedAt{};
    TimePoint lastActive{};   // refreshed by status polls
    EntryStatus status{EntryStatus::Waiting};
    std::optional<PlayerId> matchedWith;
};

struct QueueConfig {
    int baseRange{100};                              // +/- rating on join
    std::chrono::seconds expansionInterval{10};      // widen every 10 s waited...
    int expansionStep{10};                           // ...by this many points
    int maxExpansion{500};
    std::chrono::seconds staleAfter{300};            // idle entries expire
    int maxClaimRetries{3};
    int minRating{0};
    int maxRating{5000};
};

/// min(floor(waited / interval) * step, maxExpansion); 0 for negative waits.
int rangeExpansion(const QueueConfig& config, std::chrono::seconds waited);

/// baseRange + rangeExpansion(now - joinedAt).
int effectiveRange(const QueueConfig& config, TimePoint joinedAt, TimePoint now);

std::string toString(EntryStatus status);

} // namespace caro::matchmaking
