#include "matchmaking/QueueTypes.hpp"

#include <algorithm>

namespace caro::matchmaking {

int rangeExpansion(const QueueConfig& config, std::chrono::seconds waited)
{
    if (waited.count() <= 0 || config.expansionInterval.count() <= 0) {
        return 0;
    }
    const auto steps = waited.count() / config.expansionInterval.count();
    const long long widened = steps * static_cast<long long>(config.expansionStep);
    return static_cast<int>(std::min<long long>(widened, config.maxExpansion));
}

int effectiveRange(const QueueConfig& config, TimePoint joinedAt, TimePoint now)
{
    const auto waited = std::chrono::duration_cast<std::chrono::seconds>(now - joinedAt);
    return config.baseRange + rangeExpansion(config, waited);
}

std::string toString(EntryStatus status)
{
    switch (status) {
    case EntryStatus::Waiting: return "waiting";
    case EntryStatus::Matched: return "matched";
    case EntryStatus::Expired: return "expired";
    }
    return "unknown";
}

} // namespace caro::matchmaking
