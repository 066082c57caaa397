#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "matchmaking/QueueTypes.hpp"

namespace caro::matchmaking {

/// Storage for the waiting pool. Implementations backed by a remote store
/// throw core::BackingStoreUnavailable when it cannot be reached.
class IQueueStore {
public:
    virtual ~IQueueStore() = default;

    /// Insert, replacing any prior entry for the same player.
    virtual void upsert(const QueueEntry& entry) = 0;

    virtual bool remove(PlayerId player) = 0;

    virtual std::optional<QueueEntry> find(PlayerId player) const = 0;

    /// Waiting entries with minRating <= rating <= maxRating,
    /// oldest join first.
    virtual std::vector<QueueEntry> waitingInRange(int minRating, int maxRating) const = 0;

    /// Atomic conditional removal: takes the entry out of the pool only if
    /// it is still present and waiting. This is the commit step of pairing.
    virtual std::optional<QueueEntry> claim(PlayerId player) = 0;

    /// Refresh lastActive. False if the player is not queued.
    virtual bool touch(PlayerId player, TimePoint now) = 0;

    virtual std::size_t size() const = 0;

    /// 0-based rank by rating, highest first.
    virtual std::optional<std::size_t> positionOf(PlayerId player) const = 0;

    /// Remove entries idle since before `cutoff`; returned marked Expired.
    virtual std::vector<QueueEntry> expireIdleSince(TimePoint cutoff) = 0;

    virtual std::vector<QueueEntry> entries() const = 0;
};

/// Rating-ordered in-process pool; one mutex makes every call atomic.
class InMemoryQueueStore : public IQueueStore {
public:
    void upsert(const QueueEntry& entry) override;
    bool remove(PlayerId player) override;
    std::optional<QueueEntry> find(PlayerId player) const override;
    std::vector<QueueEntry> waitingInRange(int minRating, int maxRating) const override;
    std::optional<QueueEntry> claim(PlayerId player) override;
    bool touch(PlayerId player, TimePoint now) override;
    std::size_t size() const override;
    std::optional<std::size_t> positionOf(PlayerId player) const override;
    std::vector<QueueEntry> expireIdleSince(TimePoint cutoff) override;
    std::vector<QueueEntry> entries() const override;

private:
    using RatingIndex = std::multimap<int, PlayerId>;

    struct Slot {
        QueueEntry entry;
        RatingIndex::iterator byRating;
    };

    mutable std::mutex m_mutex;
    RatingIndex m_byRating;
    std::unordered_map<PlayerId, Slot> m_slots;

    void eraseLocked(std::unordered_map<PlayerId, Slot>::iterator it);
};

} // namespace caro::matchmaking
