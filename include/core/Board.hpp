#pragma once

#include "Types.hpp"
#include <vector>

namespace sweeper::core {

struct Cell {
    Position pos{};
    bool isMine{false};
    bool hasTreasure{false};
    bool isFlagged{false};
    bool isRevealed{false};
    int adjacentMines{0}; // 0..8, computed once when the board is built
};

class Board {
public:
    // contents is row-major, rows * cols entries.
    // Adjacency counts are computed here and never change afterwards.
    Board(int rows, int cols, const std::vector<CellContent>& contents, bool fixedLayout);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }
    int cellCount() const noexcept { return rows_ * cols_; }

    int mineCount() const noexcept { return mineCount_; }
    int treasureCount() const noexcept { return static_cast<int>(treasureCells_.size()); }
    const std::vector<Position>& treasureCells() const noexcept { return treasureCells_; }

    // True when the board was built from an externally supplied layout
    bool isFixedLayout() const noexcept { return fixedLayout_; }

    bool contains(Position p) const noexcept {
        return p.row >= 0 && p.row < rows_ && p.col >= 0 && p.col < cols_;
    }

    // Throws InvalidCoordinate when out of range
    const Cell& cell(int row, int col) const;
    const Cell& cell(Position p) const { return cell(p.row, p.col); }

    // King-move neighbours, clipped at the edges
    std::vector<Position> neighbors(Position p) const;

    // True if p touches (king move) any treasure cell. A treasure cell is
    // not adjacent to itself.
    bool isAdjacentToTreasure(Position p) const;

    // Rebuilds the 0/1/2 matrix this board was placed from
    Layout toLayout() const;

    // The only two mutations allowed after construction.
    // Both throw InvalidCoordinate when out of range.
    void setRevealed(Position p);
    void setFlagged(Position p, bool flagged);

private:
    int rows_;
    int cols_;
    int mineCount_{0};
    bool fixedLayout_;
    std::vector<Cell> cells_; // rows_ * cols_
    std::vector<Position> treasureCells_;

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }

    Cell& mutableCell(Position p);
    int countAdjacentMines(Position p) const;
};

} // namespace sweeper::core
