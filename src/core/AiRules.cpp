#include "core/MatchRules.hpp"

namespace caro::core {

AiRules::AiRules(IPlayerRepository& players)
    : m_players(players)
{
}

std::vector<EloChange> AiRules::onMatchFinished(const MatchRecord& record)
{
    if (record.result == MatchResult::None) {
        return {};
    }

    // The human sits on whichever side is populated; the computer has no record.
    const auto& human = record.playerX ? record.playerX : record.playerO;
    if (!human) {
        return {};
    }

    auto stored = m_players.find(human->id);
    PlayerRecord rec;
    if (stored) {
        rec = *stored;
    } else {
        rec.id = human->id;
        rec.username = human->username;
        rec.rating = human->ratingBefore;
    }

    rec.applyResult(outcomeFor(record.result, human->symbol), /*updateStreak=*/false);
    m_players.save(rec);
    return {};
}

std::vector<EloChange> LocalRules::onMatchFinished(const MatchRecord& record)
{
    (void)record;
    return {};
}

} // namespace caro::core
