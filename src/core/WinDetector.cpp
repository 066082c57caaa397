#include "core/WinDetector.hpp"

#include <algorithm>

namespace caro::core {

int countDirection(const Board& board, int row, int col,
                   int dRow, int dCol, Symbol symbol)
{
    const CellState wanted = toCell(symbol);
    int count = 0;
    int r = row + dRow;
    int c = col + dCol;
    while (board.isInside(r, c) && board.cell(r, c) == wanted) {
        ++count;
        r += dRow;
        c += dCol;
    }
    return count;
}

std::optional<std::vector<Position>>
checkWin(const Board& board, int row, int col, Symbol symbol)
{
    if (!board.isInside(row, col)) {
        return std::nullopt;
    }

    // Only the axes through the last move can have changed.
    for (const auto& axis : kAxes) {
        const int back = countDirection(board, row, col, -axis.dRow, -axis.dCol, symbol);
        const int fwd  = countDirection(board, row, col,  axis.dRow,  axis.dCol, symbol);

        if (1 + back + fwd < kWinLength) {
            continue;
        }

        // Window of kWinLength cells, as close to the negative end as
        // possible while still covering the played cell.
        const int start = std::max(-back, -(kWinLength - 1));

        std::vector<Position> line;
        line.reserve(kWinLength);
        for (int i = 0; i < kWinLength; ++i) {
            const int offset = start + i;
            line.push_back(Position{row + offset * axis.dRow, col + offset * axis.dCol});
        }
        return line;
    }

    return std::nullopt;
}

} // namespace caro::core
