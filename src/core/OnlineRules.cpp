#include "core/MatchRules.hpp"

#include <stdexcept>

namespace caro::core {

OnlineRules::OnlineRules(IPlayerRepository& players, RatingCalculator calculator)
    : m_players(players)
    , m_calculator(calculator)
{
}

PlayerRecord OnlineRules::loadOrSeed(const Participant& p) const
{
    if (auto existing = m_players.find(p.id)) {
        return *existing;
    }
    PlayerRecord seeded;
    seeded.id = p.id;
    seeded.username = p.username;
    seeded.rating = p.ratingBefore;
    return seeded;
}

std::vector<EloChange> OnlineRules::onMatchFinished(const MatchRecord& record)
{
    if (!record.playerX || !record.playerO) {
        throw std::logic_error("OnlineRules: online match finished without two participants");
    }
    if (record.result == MatchResult::None) {
        return {};
    }

    const Participant& x = *record.playerX;
    const Participant& o = *record.playerO;

    const Outcome outcomeX = outcomeFor(record.result, Symbol::X);
    const Outcome outcomeO = outcomeFor(record.result, Symbol::O);

    // Same snapshot for both sides so the order of updates cannot matter.
    const auto [changeX, changeO] =
        m_calculator.updateBoth(x.ratingBefore, o.ratingBefore, outcomeX);

    PlayerRecord recX = loadOrSeed(x);
    PlayerRecord recO = loadOrSeed(o);

    EloChange eloX{x.id, recX.username.empty() ? x.username : recX.username,
                   recX.rating, recX.rating + changeX.delta, changeX.delta,
                   m_players.rankOf(x.id).value_or(0), 0};
    EloChange eloO{o.id, recO.username.empty() ? o.username : recO.username,
                   recO.rating, recO.rating + changeO.delta, changeO.delta,
                   m_players.rankOf(o.id).value_or(0), 0};

    recX.rating = eloX.newElo;
    recO.rating = eloO.newElo;
    recX.applyResult(outcomeX, /*updateStreak=*/true);
    recO.applyResult(outcomeO, /*updateStreak=*/true);

    m_players.save(recX);
    m_players.save(recO);

    eloX.newRank = m_players.rankOf(x.id).value_or(0);
    eloO.newRank = m_players.rankOf(o.id).value_or(0);

    return {eloX, eloO};
}

} // namespace caro::core
