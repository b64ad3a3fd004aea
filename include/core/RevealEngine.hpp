#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include <cstdint>
#include <vector>

namespace sweeper::core {

enum class RevealOutcome : std::uint8_t {
    AlreadyRevealedOrFlagged,
    HitMine,
    FoundTreasure,
    Revealed
};

struct RevealResult {
    RevealOutcome outcome{RevealOutcome::AlreadyRevealedOrFlagged};
    // Cells switched to revealed by this call, the clicked cell first.
    // Empty for AlreadyRevealedOrFlagged.
    std::vector<Position> newlyRevealed;
};

enum class FlagOutcome : std::uint8_t {
    Flagged,
    Unflagged,
    IgnoredRevealed
};

// Reveals p and, for a zero-count cell, flood-fills breadth first.
// The flood never reveals a mine, a flagged cell, a treasure, or a cell
// next to a treasure; those need an explicit reveal.
// Throws InvalidCoordinate when p is off the board.
RevealResult revealCell(Board& board, Position p);

// Flips the flag of an unrevealed cell. Revealed cells are left alone.
// Throws InvalidCoordinate when p is off the board.
FlagOutcome toggleFlag(Board& board, Position p);

} // namespace sweeper::core
