#include "core/Board.hpp"
#include "core/Errors.hpp"

#include <stdexcept>
#include <string>

namespace caro::core {

Board::Board(int size)
    : size_{size}
    , grid_(size > 0 ? static_cast<std::size_t>(size * size) : 0U, CellState::Empty)
{
    if (size <= 0) {
        throw std::invalid_argument("Board size must be positive");
    }
}

CellState Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)];
}

void Board::applyMove(int row, int col, Symbol symbol) {
    if (!isInside(row, col)) {
        throw InvalidMove(MoveRejection::OutOfBounds,
                          "Move (" + std::to_string(row) + "," + std::to_string(col)
                          + ") is outside the board");
    }
    auto& target = grid_[index(row, col)];
    if (target != CellState::Empty) {
        throw InvalidMove(MoveRejection::CellOccupied, "Cell already occupied");
    }
    target = toCell(symbol);
    ++occupied_;
}

std::vector<Position> Board::emptyCells() const {
    std::vector<Position> cells;
    cells.reserve(grid_.size() - occupied_);
    for (int row = 0; row < size_; ++row) {
        for (int col = 0; col < size_; ++col) {
            if (grid_[index(row, col)] == CellState::Empty) {
                cells.push_back(Position{row, col});
            }
        }
    }
    return cells;
}

} // namespace caro::core
