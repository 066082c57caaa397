#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/MatchRegistry.hpp"
#include "matchmaking/QueueStore.hpp"
#include "matchmaking/QueueTypes.hpp"

namespace caro::matchmaking {

// Who is asking to be matched.
struct QueuedPlayer {
    PlayerId id{};
    std::string username;
    int rating{};
};

enum class QueueState : std::uint8_t {
    Matched,
    Searching,
    NotInQueue
};

struct MatchAssignment {
    core::MatchId matchId{};
    core::Symbol symbol{core::Symbol::X};
    QueuedPlayer opponent;
};

struct QueueStatusReport {
    QueueState state{QueueState::NotInQueue};
    std::optional<MatchAssignment> match;
    std::size_t position{0};
    std::size_t queueSize{0};
    int rangeMin{0};
    int rangeMax{0};
};

struct QueueStats {
    std::size_t currentSize{0};
    std::uint64_t totalJoins{0};
    std::uint64_t totalLeaves{0};
    std::uint64_t totalMatches{0};
    std::uint64_t totalExpired{0};
    std::map<std::string, std::size_t> ratingDistribution;
};

/// Skill-based pairing over a shared waiting pool.
///
/// Pairing reads candidates from a store and then commits with the store's
/// atomic claim(); a candidate found by findOpponent() is only provisional
/// until that claim succeeds. Losing the claim raises core::QueueRaceLost,
/// which requestMatch()/status() absorb by retrying.
///
/// Two stores are used: `primary` is the shared fast pool, `fallback` is the
/// authoritative copy that every write is mirrored to. When the primary
/// throws core::BackingStoreUnavailable the operation is replayed against
/// the fallback, so a store outage degrades matching instead of failing it.
class MatchmakingQueue {
public:
    MatchmakingQueue(QueueConfig config,
                     IQueueStore& primary,
                     IQueueStore& fallback,
                     core::MatchRegistry& matches,
                     std::uint32_t seed = std::random_device{}());

    const QueueConfig& config() const noexcept { return m_config; }

    /// Replace any prior entry for the player with a fresh waiting one.
    /// Throws std::invalid_argument for a rating outside the configured bounds.
    QueueEntry join(const QueuedPlayer& player, TimePoint now);

    /// Oldest waiting entry within the querying entry's effective range.
    std::optional<QueueEntry> findOpponent(PlayerId player, const QueueEntry& entry, TimePoint now);

    /// Claim both entries and start an online session with random sides.
    /// Throws core::QueueRaceLost if either entry was already taken.
    core::MatchRegistry::SessionPtr createMatch(const QueueEntry& a, const QueueEntry& b);

    /// join + findOpponent + createMatch, retrying lost races.
    QueueStatusReport requestMatch(const QueuedPlayer& player, TimePoint now);

    /// Poll: refreshes the entry's heartbeat, reports a match made by
    /// someone else's request, or tries to pair again.
    QueueStatusReport status(PlayerId player, TimePoint now);

    /// Idempotent. Returns true if an entry was removed.
    bool leave(PlayerId player);

    /// Expire entries idle for longer than maxAge.
    std::size_t cleanupExpired(TimePoint now, std::chrono::seconds maxAge);
    std::size_t cleanupExpired(TimePoint now) { return cleanupExpired(now, m_config.staleAfter); }

    QueueStats stats() const;

    /// True when the last store access had to use the fallback.
    bool isDegraded() const noexcept { return m_degraded; }

private:
    QueueConfig m_config;
    IQueueStore& m_primary;
    IQueueStore& m_fallback;
    core::MatchRegistry& m_matches;

    mutable std::atomic<bool> m_degraded{false};

    std::mutex m_rngMutex;
    std::mt19937 m_rng;

    // Matches made by another player's request, waiting to be polled.
    std::mutex m_assignMutex;
    std::unordered_map<PlayerId, MatchAssignment> m_assignments;

    std::atomic<std::uint64_t> m_totalJoins{0};
    std::atomic<std::uint64_t> m_totalLeaves{0};
    std::atomic<std::uint64_t> m_totalMatches{0};
    std::atomic<std::uint64_t> m_totalExpired{0};

    template <typename Fn>
    auto withStore(Fn&& fn) const -> decltype(fn(std::declval<IQueueStore&>()));

    IQueueStore& other(const IQueueStore& used) const;
    void mirrorRemove(const IQueueStore& used, PlayerId player);

    std::optional<QueueEntry> findOpponentOn(IQueueStore& store, PlayerId player,
                                             const QueueEntry& entry, TimePoint now) const;
    core::MatchRegistry::SessionPtr createMatchOn(IQueueStore& store,
                                                  const QueueEntry& a, const QueueEntry& b);

    std::optional<QueueStatusReport> pairWithRetries(const QueueEntry& entry, TimePoint now);
    std::optional<MatchAssignment> takeAssignment(PlayerId player);
    QueueStatusReport searchingReport(const QueueEntry& entry, TimePoint now) const;
};

} // namespace caro::matchmaking
