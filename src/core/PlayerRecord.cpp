#include "core/PlayerRecord.hpp"

namespace caro::core {

void PlayerRecord::applyResult(Outcome outcome, bool updateStreak) {
    switch (outcome) {
    case Outcome::Win:
        ++wins;
        if (updateStreak) {
            ++currentStreak;
            if (currentStreak > bestStreak) {
                bestStreak = currentStreak;
            }
        }
        break;
    case Outcome::Loss:
        ++losses;
        if (updateStreak) currentStreak = 0;
        break;
    case Outcome::Draw:
        ++draws;
        if (updateStreak) currentStreak = 0;
        break;
    }
}

std::optional<PlayerRecord> InMemoryPlayerRepository::find(PlayerId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryPlayerRepository::save(const PlayerRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_players[record.id] = record;
}

std::optional<int> InMemoryPlayerRepository::rankOf(PlayerId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it == m_players.end()) {
        return std::nullopt;
    }
    int higher = 0;
    for (const auto& [otherId, other] : m_players) {
        (void)otherId;
        if (other.rating > it->second.rating) ++higher;
    }
    return higher + 1;
}

PlayerRecord InMemoryPlayerRepository::findOrCreate(PlayerId id,
                                                    const std::string& username,
                                                    int initialRating)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(id);
    if (it != m_players.end()) {
        return it->second;
    }
    PlayerRecord record;
    record.id = id;
    record.username = username;
    record.rating = initialRating;
    m_players.emplace(id, record);
    return record;
}

std::size_t InMemoryPlayerRepository::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_players.size();
}

} // namespace caro::core
