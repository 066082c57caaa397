#include "matchmaking/MatchmakingQueue.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "core/Errors.hpp"

namespace caro::matchmaking {

namespace {
    std::string ratingBucket(int rating) {
        if (rating < 1000) return "below_1000";
        if (rating < 1200) return "1000_1199";
        if (rating < 1400) return "1200_1399";
        if (rating < 1600) return "1400_1599";
        if (rating < 1800) return "1600_1799";
        return "1800_plus";
    }

    core::Participant toParticipant(const QueueEntry& e, core::Symbol symbol) {
        return core::Participant{e.playerId, e.username, symbol, e.rating};
    }

    QueuedPlayer toQueued(const QueueEntry& e) {
        return QueuedPlayer{e.playerId, e.username, e.rating};
    }

    QueueStatusReport matchedReport(const MatchAssignment& assignment) {
        QueueStatusReport report;
        report.state = QueueState::Matched;
        report.match = assignment;
        return report;
    }
}

MatchmakingQueue::MatchmakingQueue(QueueConfig config,
                                   IQueueStore& primary,
                                   IQueueStore& fallback,
                                   core::MatchRegistry& matches,
                                   std::uint32_t seed)
    : m_config(config)
    , m_primary(primary)
    , m_fallback(fallback)
    , m_matches(matches)
    , m_rng(seed)
{
}

template <typename Fn>
auto MatchmakingQueue::withStore(Fn&& fn) const -> decltype(fn(std::declval<IQueueStore&>()))
{
    try {
        auto result = fn(m_primary);
        m_degraded = false;
        return result;
    } catch (const core::BackingStoreUnavailable& e) {
        if (!m_degraded.exchange(true)) {
            std::cerr << "[QUEUE] Primary store unavailable (" << e.what()
                      << "), switching to fallback store\n";
        }
        return fn(m_fallback);
    }
}

IQueueStore& MatchmakingQueue::other(const IQueueStore& used) const
{
    return (&used == &m_primary) ? m_fallback : m_primary;
}

void MatchmakingQueue::mirrorRemove(const IQueueStore& used, PlayerId player)
{
    try {
        other(used).remove(player);
    } catch (const core::BackingStoreUnavailable& e) {
        std::cerr << "[QUEUE] Could not mirror removal of player " << player
                  << ": " << e.what() << "\n";
    }
}

QueueEntry MatchmakingQueue::join(const QueuedPlayer& player, TimePoint now)
{
    if (player.rating < m_config.minRating || player.rating > m_config.maxRating) {
        throw std::invalid_argument("Rating " + std::to_string(player.rating)
                                    + " is outside [" + std::to_string(m_config.minRating)
                                    + ", " + std::to_string(m_config.maxRating) + "]");
    }

    QueueEntry entry;
    entry.playerId   = player.id;
    entry.username   = player.username;
    entry.rating     = player.rating;
    entry.joinedAt   = now;
    entry.lastActive = now;
    entry.status     = EntryStatus::Waiting;

    // A new join supersedes both an old entry and an unread match notice.
    {
        std::lock_guard<std::mutex> lock(m_assignMutex);
        m_assignments.erase(player.id);
    }

    try {
        m_primary.upsert(entry);
    } catch (const core::BackingStoreUnavailable& e) {
        m_degraded = true;
        std::cerr << "[QUEUE] Primary store unavailable on join of player " << player.id
                  << " (" << e.what() << "); queued in fallback store only\n";
    }
    m_fallback.upsert(entry);

    ++m_totalJoins;
    std::cout << "[QUEUE] Player " << player.id << " (" << player.username
              << ", rating " << player.rating << ") joined\n";
    return entry;
}

std::optional<QueueEntry>
MatchmakingQueue::findOpponentOn(IQueueStore& store, PlayerId player,
                                 const QueueEntry& entry, TimePoint now) const
{
    const int range = effectiveRange(m_config, entry.joinedAt, now);
    for (const auto& candidate : store.waitingInRange(entry.rating - range, entry.rating + range)) {
        if (candidate.playerId != player) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<QueueEntry>
MatchmakingQueue::findOpponent(PlayerId player, const QueueEntry& entry, TimePoint now)
{
    return withStore([&](IQueueStore& store) {
        return findOpponentOn(store, player, entry, now);
    });
}

core::MatchRegistry::SessionPtr
MatchmakingQueue::createMatchOn(IQueueStore& store, const QueueEntry& a, const QueueEntry& b)
{
    if (a.playerId == b.playerId) {
        throw std::invalid_argument("createMatch: a player cannot be matched with themselves");
    }

    // Commit point: whoever removes the opponent from the pool owns the pairing.
    auto claimedB = store.claim(b.playerId);
    if (!claimedB) {
        throw core::QueueRaceLost("Player " + std::to_string(b.playerId) + " was already claimed");
    }
    auto claimedA = store.claim(a.playerId);
    if (!claimedA) {
        store.upsert(*claimedB); // give the opponent back untouched
        throw core::QueueRaceLost("Player " + std::to_string(a.playerId) + " is no longer waiting");
    }
    mirrorRemove(store, a.playerId);
    mirrorRemove(store, b.playerId);

    claimedA->status = EntryStatus::Matched;
    claimedA->matchedWith = claimedB->playerId;
    claimedB->status = EntryStatus::Matched;
    claimedB->matchedWith = claimedA->playerId;

    bool aPlaysX = false;
    {
        std::lock_guard<std::mutex> lock(m_rngMutex);
        aPlaysX = std::bernoulli_distribution(0.5)(m_rng);
    }
    const QueueEntry& x = aPlaysX ? *claimedA : *claimedB;
    const QueueEntry& o = aPlaysX ? *claimedB : *claimedA;

    auto session = m_matches.createOnline(toParticipant(x, core::Symbol::X),
                                          toParticipant(o, core::Symbol::O));

    {
        std::lock_guard<std::mutex> lock(m_assignMutex);
        m_assignments[x.playerId] = MatchAssignment{session->id(), core::Symbol::X, toQueued(o)};
        m_assignments[o.playerId] = MatchAssignment{session->id(), core::Symbol::O, toQueued(x)};
    }

    ++m_totalMatches;
    std::cout << "[QUEUE] Match " << session->id() << ": " << x.username << " (" << x.rating
              << ") vs " << o.username << " (" << o.rating << ")\n";
    return session;
}

core::MatchRegistry::SessionPtr
MatchmakingQueue::createMatch(const QueueEntry& a, const QueueEntry& b)
{
    return withStore([&](IQueueStore& store) {
        return createMatchOn(store, a, b);
    });
}

std::optional<MatchAssignment> MatchmakingQueue::takeAssignment(PlayerId player)
{
    std::lock_guard<std::mutex> lock(m_assignMutex);
    auto it = m_assignments.find(player);
    if (it == m_assignments.end()) {
        return std::nullopt;
    }
    MatchAssignment assignment = it->second;
    m_assignments.erase(it);
    return assignment;
}

std::optional<QueueStatusReport>
MatchmakingQueue::pairWithRetries(const QueueEntry& entry, TimePoint now)
{
    const int attempts = m_config.maxClaimRetries > 0 ? m_config.maxClaimRetries : 1;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (auto assignment = takeAssignment(entry.playerId)) {
            return matchedReport(*assignment);
        }
        try {
            auto session = withStore([&](IQueueStore& store) -> core::MatchRegistry::SessionPtr {
                auto opponent = findOpponentOn(store, entry.playerId, entry, now);
                if (!opponent) {
                    return nullptr;
                }
                return createMatchOn(store, entry, *opponent);
            });
            if (!session) {
                return std::nullopt;
            }
        } catch (const core::QueueRaceLost& e) {
            std::cout << "[QUEUE] Race lost for player " << entry.playerId
                      << " (" << e.what() << "), retrying\n";
            continue;
        }

        QueueStatusReport report;
        report.state = QueueState::Matched;
        report.match = takeAssignment(entry.playerId);
        return report;
    }
    return std::nullopt;
}

QueueStatusReport MatchmakingQueue::searchingReport(const QueueEntry& entry, TimePoint now) const
{
    QueueStatusReport report;
    report.state = QueueState::Searching;
    report.position = withStore([&](IQueueStore& store) {
        return store.positionOf(entry.playerId);
    }).value_or(0);
    report.queueSize = withStore([](IQueueStore& store) { return store.size(); });

    const int range = effectiveRange(m_config, entry.joinedAt, now);
    report.rangeMin = entry.rating - range;
    report.rangeMax = entry.rating + range;
    return report;
}

QueueStatusReport MatchmakingQueue::requestMatch(const QueuedPlayer& player, TimePoint now)
{
    const QueueEntry entry = join(player, now);
    if (auto matched = pairWithRetries(entry, now)) {
        return *matched;
    }

    // Someone may have claimed us while our own attempts were failing.
    if (auto assignment = takeAssignment(player.id)) {
        return matchedReport(*assignment);
    }
    return searchingReport(entry, now);
}

QueueStatusReport MatchmakingQueue::status(PlayerId player, TimePoint now)
{
    if (auto assignment = takeAssignment(player)) {
        return matchedReport(*assignment);
    }

    bool queued = false;
    try {
        queued = m_primary.touch(player, now);
    } catch (const core::BackingStoreUnavailable& e) {
        m_degraded = true;
        std::cerr << "[QUEUE] Primary store unavailable on poll of player " << player
                  << " (" << e.what() << ")\n";
    }
    queued = m_fallback.touch(player, now) || queued;
    if (!queued) {
        return QueueStatusReport{}; // NotInQueue
    }

    const auto entry = withStore([&](IQueueStore& store) { return store.find(player); });
    if (!entry) {
        return QueueStatusReport{};
    }

    if (auto matched = pairWithRetries(*entry, now)) {
        return *matched;
    }
    if (auto assignment = takeAssignment(player)) {
        return matchedReport(*assignment);
    }
    return searchingReport(*entry, now);
}

bool MatchmakingQueue::leave(PlayerId player)
{
    bool removed = false;
    try {
        removed = m_primary.remove(player);
    } catch (const core::BackingStoreUnavailable& e) {
        m_degraded = true;
        std::cerr << "[QUEUE] Primary store unavailable on leave of player " << player
                  << " (" << e.what() << ")\n";
    }
    removed = m_fallback.remove(player) || removed;

    {
        std::lock_guard<std::mutex> lock(m_assignMutex);
        m_assignments.erase(player);
    }

    if (removed) {
        ++m_totalLeaves;
        std::cout << "[QUEUE] Player " << player << " left\n";
    }
    return removed;
}

std::size_t MatchmakingQueue::cleanupExpired(TimePoint now, std::chrono::seconds maxAge)
{
    const TimePoint cutoff = now - maxAge;

    std::size_t expiredCount = 0;
    try {
        expiredCount = m_primary.expireIdleSince(cutoff).size();
    } catch (const core::BackingStoreUnavailable& e) {
        m_degraded = true;
        std::cerr << "[QUEUE] Primary store unavailable during cleanup (" << e.what() << ")\n";
    }
    const auto fromFallback = m_fallback.expireIdleSince(cutoff).size();
    expiredCount = std::max(expiredCount, fromFallback);

    if (expiredCount > 0) {
        m_totalExpired += expiredCount;
        std::cout << "[QUEUE] Cleaned up " << expiredCount << " stale queue entries\n";
    }
    return expiredCount;
}

QueueStats MatchmakingQueue::stats() const
{
    QueueStats out;
    const auto all = withStore([](IQueueStore& store) { return store.entries(); });
    out.currentSize  = all.size();
    out.totalJoins   = m_totalJoins;
    out.totalLeaves  = m_totalLeaves;
    out.totalMatches = m_totalMatches;
    out.totalExpired = m_totalExpired;
    for (const auto& entry : all) {
        ++out.ratingDistribution[ratingBucket(entry.rating)];
    }
    return out;
}

} // namespace caro::matchmaking
