#pragma once

#include "Board.hpp"
#include "RatingCalculator.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace caro::core {

// A seated player and the rating they brought into the match.
struct Participant {
    PlayerId id{};
    std::string username;
    Symbol symbol{Symbol::X};
    int ratingBefore{1200};
};

// Rating movement reported to clients after an online match.
struct EloChange {
    PlayerId userId{};
    std::string username;
    int oldElo{};
    int newElo{};
    int change{};
    int oldRank{};
    int newRank{};
};

// Everything the storage collaborator persists for a match.
struct MatchRecord {
    MatchId id{};
    MatchMode mode{MatchMode::Local};
    std::optional<Participant> playerX;
    std::optional<Participant> playerO;

    Board board;
    std::vector<Move> moves;
    Symbol currentTurn{Symbol::X};
    MatchStatus status{MatchStatus::Waiting};
    MatchResult result{MatchResult::None};
    std::vector<Position> winningLine;

    std::optional<RatingChange> ratingX;
    std::optional<RatingChange> ratingO;
};

} // namespace caro::core
