#pragma once

#include "Types.hpp"
#include <vector>

namespace caro::core {

enum class CellState : std::uint8_t {
    Empty,
    X,
    O
};

inline CellState toCell(Symbol s) {
    return s == Symbol::X ? CellState::X : CellState::O;
}

class Board {
public:
    Board() : Board(kBoardSize) {}
    explicit Board(int size);

    int size() const noexcept { return size_; }

    CellState cell(int row, int col) const;

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < size_ && col >= 0 && col < size_;
    }

    bool isEmpty(int row, int col) const {
        return cell(row, col) == CellState::Empty;
    }

    // Place a stone. Throws InvalidMove(OutOfBounds / CellOccupied) and
    // leaves the board untouched when the cell cannot take it.
    void applyMove(int row, int col, Symbol symbol);

    // True when no Empty cell remains.
    bool isFull() const noexcept { return occupied_ == grid_.size(); }

    std::size_t occupiedCount() const noexcept { return occupied_; }

    // Empty cells in row-major order.
    std::vector<Position> emptyCells() const;

private:
    int size_;
    std::vector<CellState> grid_; // size_ * size_
    std::size_t occupied_{0};

    std::size_t index(int row, int col) const noexcept {
        return static_cast<std::size_t>(row * size_ + col);
    }
};

} // namespace caro::core
