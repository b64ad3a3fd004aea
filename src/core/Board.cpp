#include "core/Board.hpp"
#include "core/Errors.hpp"

#include <string>

namespace sweeper::core {

Board::Board(int rows, int cols, const std::vector<CellContent>& contents, bool fixedLayout)
    : rows_{rows}
    , cols_{cols}
    , fixedLayout_{fixedLayout}
{
    if (rows <= 0 || cols <= 0) {
        throw ConfigurationError("Board dimensions must be positive");
    }
    if (static_cast<int>(contents.size()) != rows * cols) {
        throw ConfigurationError("Board contents do not match "
                                 + std::to_string(rows) + "x" + std::to_string(cols));
    }

    cells_.resize(contents.size());
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            Cell& cell = cells_[index(r, c)];
            cell.pos = Position{r, c};

            switch (contents[index(r, c)]) {
            case CellContent::Mine:
                cell.isMine = true;
                ++mineCount_;
                break;
            case CellContent::Treasure:
                cell.hasTreasure = true;
                treasureCells_.push_back(cell.pos);
                break;
            case CellContent::Empty:
                break;
            }
        }
    }

    // Placement is final at this point, so counts stay valid for the whole game
    for (auto& cell : cells_) {
        cell.adjacentMines = countAdjacentMines(cell.pos);
    }
}

const Cell& Board::cell(int row, int col) const {
    if (!contains(Position{row, col})) {
        throw InvalidCoordinate("Board::cell out of range ("
                                + std::to_string(row) + ", " + std::to_string(col) + ")");
    }
    return cells_[index(row, col)];
}

Cell& Board::mutableCell(Position p) {
    if (!contains(p)) {
        throw InvalidCoordinate("Board position out of range ("
                                + std::to_string(p.row) + ", " + std::to_string(p.col) + ")");
    }
    return cells_[index(p.row, p.col)];
}

std::vector<Position> Board::neighbors(Position p) const {
    std::vector<Position> result;
    result.reserve(8);
    for (int dr = -1; dr <= 1; ++dr) {
        for (int dc = -1; dc <= 1; ++dc) {
            if (dr == 0 && dc == 0) continue;
            Position n{p.row + dr, p.col + dc};
            if (contains(n)) {
                result.push_back(n);
            }
        }
    }
    return result;
}

bool Board::isAdjacentToTreasure(Position p) const {
    for (const auto& t : treasureCells_) {
        const int dr = t.row - p.row;
        const int dc = t.col - p.col;
        if (dr == 0 && dc == 0) continue;
        if (dr >= -1 && dr <= 1 && dc >= -1 && dc <= 1) {
            return true;
        }
    }
    return false;
}

Layout Board::toLayout() const {
    Layout layout(rows_, std::vector<int>(cols_, 0));
    for (const auto& cell : cells_) {
        if (cell.isMine) {
            layout[cell.pos.row][cell.pos.col] = static_cast<int>(CellContent::Mine);
        } else if (cell.hasTreasure) {
            layout[cell.pos.row][cell.pos.col] = static_cast<int>(CellContent::Treasure);
        }
    }
    return layout;
}

void Board::setRevealed(Position p) {
    mutableCell(p).isRevealed = true;
}

void Board::setFlagged(Position p, bool flagged) {
    mutableCell(p).isFlagged = flagged;
}

int Board::countAdjacentMines(Position p) const {
    int count = 0;
    for (const auto& n : neighbors(p)) {
        if (cells_[index(n.row, n.col)].isMine) {
            ++count;
        }
    }
    return count;
}

} // namespace sweeper::core
