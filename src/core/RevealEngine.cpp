#include "core/RevealEngine.hpp"

#include <deque>

namespace sweeper::core {

namespace {

bool canAutoReveal(const Board& board, const Cell& cell) {
    if (cell.isRevealed || cell.isMine || cell.isFlagged) return false;
    if (cell.hasTreasure) return false;
    return !board.isAdjacentToTreasure(cell.pos);
}

} // namespace

RevealResult revealCell(Board& board, Position p) {
    RevealResult result;

    const Cell& start = board.cell(p); // throws when off the board
    if (start.isRevealed || start.isFlagged) {
        result.outcome = RevealOutcome::AlreadyRevealedOrFlagged;
        return result;
    }

    board.setRevealed(p);
    result.newlyRevealed.push_back(p);

    if (start.isMine) {
        result.outcome = RevealOutcome::HitMine;
        return result;
    }
    if (start.hasTreasure) {
        result.outcome = RevealOutcome::FoundTreasure;
        return result;
    }

    result.outcome = RevealOutcome::Revealed;

    // Numbered cells never cascade
    if (start.adjacentMines > 0) {
        return result;
    }

    // Each cell is revealed at most once, so the queue drains in O(cells)
    std::deque<Position> queue;
    queue.push_back(p);

    while (!queue.empty()) {
        const Position current = queue.front();
        queue.pop_front();

        for (const auto& n : board.neighbors(current)) {
            const Cell& neighbor = board.cell(n);
            if (!canAutoReveal(board, neighbor)) {
                continue;
            }

            board.setRevealed(n);
            result.newlyRevealed.push_back(n);

            if (neighbor.adjacentMines == 0) {
                queue.push_back(n);
            }
        }
    }

    return result;
}

FlagOutcome toggleFlag(Board& board, Position p) {
    const Cell& cell = board.cell(p);
    if (cell.isRevealed) {
        return FlagOutcome::IgnoredRevealed;
    }

    const bool flagged = !cell.isFlagged;
    board.setFlagged(p, flagged);
    return flagged ? FlagOutcome::Flagged : FlagOutcome::Unflagged;
}

} // namespace sweeper::core
