#pragma once

#include "Board.hpp"
#include "Types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace caro::core {

struct Axis {
    int dRow{};
    int dCol{};
};

// Horizontal, vertical, diagonal "\" and anti-diagonal "/".
constexpr std::array<Axis, 4> kAxes{{{0, 1}, {1, 0}, {1, 1}, {1, -1}}};

/// Number of contiguous `symbol` stones starting one step away from
/// (row, col) in direction (dRow, dCol). The origin itself is not counted.
int countDirection(const Board& board, int row, int col,
                   int dRow, int dCol, Symbol symbol);

/// Checks the four axes through (row, col), treating that cell as holding
/// `symbol` whether or not it has been placed yet. Returns the winning line
/// (kWinLength cells, ordered from one end of the axis to the other and
/// always containing (row, col)) or std::nullopt.
std::optional<std::vector<Position>>
checkWin(const Board& board, int row, int col, Symbol symbol);

inline bool wouldWin(const Board& board, int row, int col, Symbol symbol) {
    return checkWin(board, row, col, symbol).has_value();
}

} // namespace caro::core
