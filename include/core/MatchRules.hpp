#pragma once

#include <vector>

#include "core/MatchRecord.hpp"
#include "core/PlayerRecord.hpp"
#include "core/RatingCalculator.hpp"

namespace caro::core {

// Strategy for what a finished match does to player records.
// The owning session calls onMatchFinished() exactly once, from whichever
// caller won the finish claim.
class IMatchRules {
public:
    virtual ~IMatchRules() = default;

    virtual MatchMode mode() const = 0;

    // `record` already carries the final status and result.
    // Returns rating changes for clients (empty when ratings do not move).
    virtual std::vector<EloChange> onMatchFinished(const MatchRecord& record) = 0;
};

// =============================
// OnlineRules
// =============================
// Ranked play between two accounts:
// - both ratings move, computed from the pre-match snapshots
// - win/loss/draw counters and streaks are updated on both sides
class OnlineRules : public IMatchRules {
public:
    OnlineRules(IPlayerRepository& players, RatingCalculator calculator);

    MatchMode mode() const override { return MatchMode::Online; }

    std::vector<EloChange> onMatchFinished(const MatchRecord& record) override;

private:
    IPlayerRepository& m_players;
    RatingCalculator m_calculator;

    PlayerRecord loadOrSeed(const Participant& p) const;
};

// =============================
// AiRules
// =============================
// Practice against the computer: only the human's counters move.
// No rating change and no streak.
class AiRules : public IMatchRules {
public:
    explicit AiRules(IPlayerRepository& players);

    MatchMode mode() const override { return MatchMode::Ai; }

    std::vector<EloChange> onMatchFinished(const MatchRecord& record) override;

private:
    IPlayerRepository& m_players;
};

// Two people on one device; nothing is persisted.
class LocalRules : public IMatchRules {
public:
    MatchMode mode() const override { return MatchMode::Local; }

    std::vector<EloChange> onMatchFinished(const MatchRecord& record) override;
};

} // namespace caro::core
