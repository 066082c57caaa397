#pragma once

#include "Types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace caro::core {

// The slice of a user account the game core reads and writes.
struct PlayerRecord {
    PlayerId id{};
    std::string username;
    int rating{1200};

    int wins{0};
    int losses{0};
    int draws{0};
    int currentStreak{0};
    int bestStreak{0};

    int totalGames() const noexcept { return wins + losses + draws; }

    // Percentage, 0 before the first game.
    double winRate() const noexcept {
        const int total = totalGames();
        return total == 0 ? 0.0 : (static_cast<double>(wins) / total) * 100.0;
    }

    void applyResult(Outcome outcome, bool updateStreak);
};

// Account storage lives outside the core; this is the contract it honours.
class IPlayerRepository {
public:
    virtual ~IPlayerRepository() = default;

    virtual std::optional<PlayerRecord> find(PlayerId id) const = 0;
    virtual void save(const PlayerRecord& record) = 0;

    // 1 + number of players with a strictly higher rating.
    virtual std::optional<int> rankOf(PlayerId id) const = 0;
};

class InMemoryPlayerRepository : public IPlayerRepository {
public:
    std::optional<PlayerRecord> find(PlayerId id) const override;
    void save(const PlayerRecord& record) override;
    std::optional<int> rankOf(PlayerId id) const override;

    // Returns the existing record, or stores and returns a fresh one.
    PlayerRecord findOrCreate(PlayerId id, const std::string& username, int initialRating);

    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<PlayerId, PlayerRecord> m_players;
};

} // namespace caro::core
