#include "matchmaking/QueueStore.hpp"

#include <algorithm>
#include <iterator>

namespace caro::matchmaking {

void InMemoryQueueStore::eraseLocked(std::unordered_map<PlayerId, Slot>::iterator it)
{
    m_byRating.erase(it->second.byRating);
    m_slots.erase(it);
}

void InMemoryQueueStore::upsert(const QueueEntry& entry)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto existing = m_slots.find(entry.playerId);
    if (existing != m_slots.end()) {
        eraseLocked(existing);
    }
    auto ratingIt = m_byRating.emplace(entry.rating, entry.playerId);
    m_slots.emplace(entry.playerId, Slot{entry, ratingIt});
}

bool InMemoryQueueStore::remove(PlayerId player)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(player);
    if (it == m_slots.end()) {
        return false;
    }
    eraseLocked(it);
    return true;
}

std::optional<QueueEntry> InMemoryQueueStore::find(PlayerId player) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(player);
    if (it == m_slots.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

std::vector<QueueEntry> InMemoryQueueStore::waitingInRange(int minRating, int maxRating) const
{
    std::vector<QueueEntry> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto first = m_byRating.lower_bound(minRating);
        auto last  = m_byRating.upper_bound(maxRating);
        for (auto it = first; it != last; ++it) {
            const auto& entry = m_slots.at(it->second).entry;
            if (entry.status == EntryStatus::Waiting) {
                out.push_back(entry);
            }
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const QueueEntry& a, const QueueEntry& b) {
                         if (a.joinedAt != b.joinedAt) return a.joinedAt < b.joinedAt;
                         return a.playerId < b.playerId;
                     });
    return out;
}

std::optional<QueueEntry> InMemoryQueueStore::claim(PlayerId player)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(player);
    if (it == m_slots.end() || it->second.entry.status != EntryStatus::Waiting) {
        return std::nullopt;
    }
    QueueEntry claimed = it->second.entry;
    eraseLocked(it);
    return claimed;
}

bool InMemoryQueueStore::touch(PlayerId player, TimePoint now)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(player);
    if (it == m_slots.end()) {
        return false;
    }
    it->second.entry.lastActive = now;
    return true;
}

std::size_t InMemoryQueueStore::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

std::optional<std::size_t> InMemoryQueueStore::positionOf(PlayerId player) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(player);
    if (it == m_slots.end()) {
        return std::nullopt;
    }
    const int rating = it->second.entry.rating;
    const auto higher = std::distance(m_byRating.upper_bound(rating), m_byRating.end());
    return static_cast<std::size_t>(higher);
}

std::vector<QueueEntry> InMemoryQueueStore::expireIdleSince(TimePoint cutoff)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<QueueEntry> expired;
    for (auto it = m_slots.begin(); it != m_slots.end();) {
        if (it->second.entry.lastActive < cutoff) {
            QueueEntry gone = it->second.entry;
            gone.status = EntryStatus::Expired;
            expired.push_back(gone);
            auto next = std::next(it);
            eraseLocked(it);
            it = next;
        } else {
            ++it;
        }
    }
    return expired;
}

std::vector<QueueEntry> InMemoryQueueStore::entries() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<QueueEntry> out;
    out.reserve(m_slots.size());
    for (const auto& [rating, player] : m_byRating) {
        (void)rating;
        out.push_back(m_slots.at(player).entry);
    }
    return out;
}

} // namespace caro::matchmaking
