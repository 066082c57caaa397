#include "core/MoveSelector.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>

namespace caro::core {

std::optional<Difficulty> parseDifficulty(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "easy")   return Difficulty::Easy;
    if (lower == "medium") return Difficulty::Medium;
    if (lower == "hard")   return Difficulty::Hard;
    return std::nullopt;
}

std::string toString(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::Easy:   return "easy";
    case Difficulty::Medium: return "medium";
    case Difficulty::Hard:   return "hard";
    }
    return "medium";
}

Position MoveSelector::selectMove(const Board& board, Symbol aiSymbol,
                                  Difficulty difficulty, std::mt19937& rng) const
{
    if (board.isFull()) {
        throw std::invalid_argument("MoveSelector: board has no empty cell");
    }

    switch (difficulty) {
    case Difficulty::Easy:
        return randomMove(board, rng);
    case Difficulty::Medium:
    case Difficulty::Hard:
        break;
    }
    return heuristicMove(board, aiSymbol, rng);
}

int MoveSelector::lineValue(int count, int openEnds) noexcept {
    if (count >= kWinLength) return 10000;
    if (openEnds <= 0) return 0; // boxed in on both sides

    const bool bothOpen = openEnds >= 2;
    switch (count) {
    case 4: return bothOpen ? 5000 : 1200;
    case 3: return bothOpen ? 400 : 120;
    case 2: return bothOpen ? 80 : 30;
    case 1: return bothOpen ? 15 : 5;
    default: return 0;
    }
}

int MoveSelector::lineStrength(const Board& board, Position at, Symbol symbol, Axis axis) {
    const CellState wanted = toCell(symbol);
    int count = 1;
    int openEnds = 0;

    for (int sign : {-1, 1}) {
        int r = at.row + sign * axis.dRow;
        int c = at.col + sign * axis.dCol;
        while (board.isInside(r, c) && board.cell(r, c) == wanted) {
            ++count;
            r += sign * axis.dRow;
            c += sign * axis.dCol;
        }
        if (board.isInside(r, c) && board.cell(r, c) == CellState::Empty) {
            ++openEnds;
        }
    }

    return lineValue(count, openEnds);
}

double MoveSelector::scoreCandidate(const Board& board, Position at, Symbol aiSymbol) {
    const Symbol opponent = opponentOf(aiSymbol);
    double score = 0.0;

    for (const auto& axis : kAxes) {
        score += lineStrength(board, at, aiSymbol, axis);
        score += kDefenseWeight * lineStrength(board, at, opponent, axis);
    }

    const CellState friendly = toCell(aiSymbol);
    for (int dr = -1; dr <= 1; ++dr) {
        for (int dc = -1; dc <= 1; ++dc) {
            if (dr == 0 && dc == 0) continue;
            const int r = at.row + dr;
            const int c = at.col + dc;
            if (board.isInside(r, c) && board.cell(r, c) == friendly) {
                score += kAdjacencyBonus;
            }
        }
    }

    return score;
}

std::vector<Position> MoveSelector::candidates(const Board& board) {
    std::vector<Position> out;
    for (int row = 0; row < board.size(); ++row) {
        for (int col = 0; col < board.size(); ++col) {
            if (board.cell(row, col) != CellState::Empty) continue;

            bool nearStone = false;
            for (int dr = -1; dr <= 1 && !nearStone; ++dr) {
                for (int dc = -1; dc <= 1; ++dc) {
                    if (dr == 0 && dc == 0) continue;
                    const int r = row + dr;
                    const int c = col + dc;
                    if (board.isInside(r, c) && board.cell(r, c) != CellState::Empty) {
                        nearStone = true;
                        break;
                    }
                }
            }
            if (nearStone) {
                out.push_back(Position{row, col});
            }
        }
    }
    return out;
}

Position MoveSelector::randomMove(const Board& board, std::mt19937& rng) {
    const auto empty = board.emptyCells();
    if (empty.empty()) {
        throw std::invalid_argument("MoveSelector: board has no empty cell");
    }
    std::uniform_int_distribution<std::size_t> pick(0, empty.size() - 1);
    return empty[pick(rng)];
}

std::optional<Position> MoveSelector::findWinningCell(const Board& board, Symbol symbol) {
    for (const auto& cell : board.emptyCells()) {
        if (wouldWin(board, cell.row, cell.col, symbol)) {
            return cell;
        }
    }
    return std::nullopt;
}

Position MoveSelector::heuristicMove(const Board& board, Symbol aiSymbol, std::mt19937& rng) {
    if (auto win = findWinningCell(board, aiSymbol)) {
        return *win;
    }
    if (auto block = findWinningCell(board, opponentOf(aiSymbol))) {
        return *block;
    }

    const auto cells = candidates(board);
    if (cells.empty()) {
        return randomMove(board, rng);
    }

    // Strictly greater keeps the first (row-major) cell on ties.
    Position best = cells.front();
    double bestScore = scoreCandidate(board, best, aiSymbol);
    for (std::size_t i = 1; i < cells.size(); ++i) {
        const double s = scoreCandidate(board, cells[i], aiSymbol);
        if (s > bestScore) {
            bestScore = s;
            best = cells[i];
        }
    }
    return best;
}

} // namespace caro::core
