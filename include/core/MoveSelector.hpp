#pragma once

#include "Board.hpp"
#include "Types.hpp"
#include "WinDetector.hpp"

#include <optional>
#include <random>
#include <string>
#include <vector>

namespace caro::core {

enum class Difficulty : std::uint8_t {
    Easy,
    Medium,
    Hard // same heuristic as Medium until a real search exists
};

std::optional<Difficulty> parseDifficulty(const std::string& text);
std::string toString(Difficulty difficulty);

/// Heuristic move picker for the computer opponent.
/// Holds no game state; the random source is supplied by the caller so the
/// same selector can serve every match.
class MoveSelector {
public:
    static constexpr double kDefenseWeight  = 0.8;
    static constexpr double kAdjacencyBonus = 8.0;

    /// Throws std::invalid_argument if the board has no empty cell.
    Position selectMove(const Board& board, Symbol aiSymbol,
                        Difficulty difficulty, std::mt19937& rng) const;

    /// Value table keyed by (run length, open ends).
    static int lineValue(int count, int openEnds) noexcept;

    /// Strength of the line a hypothetical `symbol` stone at `at` would
    /// make along one axis.
    static int lineStrength(const Board& board, Position at, Symbol symbol, Axis axis);

    /// Offence + weighted defence + clustering bonus for one empty cell.
    static double scoreCandidate(const Board& board, Position at, Symbol aiSymbol);

    /// Empty cells within Chebyshev distance 1 of a stone, row-major.
    static std::vector<Position> candidates(const Board& board);

private:
    static Position randomMove(const Board& board, std::mt19937& rng);
    static std::optional<Position> findWinningCell(const Board& board, Symbol symbol);
    static Position heuristicMove(const Board& board, Symbol aiSymbol, std::mt19937& rng);
};

} // namespace caro::core
