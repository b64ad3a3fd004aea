#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include <optional>

namespace sweeper::core {

// Construction parameters of one game. Kept by GameState so restart can
// rebuild the same kind of board.
struct GameParameters {
    int rows{8};
    int cols{8};
    int mineCount{10};
    int treasureCount{1};

    // When set, placement is taken from here instead of the RNG and the
    // mine/treasure counts are derived from it.
    std::optional<Layout> layout;
};

// Random mode: mines first, then treasures among the remaining cells,
// both sampled without replacement.
// Fixed mode: copies params.layout.
// Throws ConfigurationError when the parameters cannot produce a board,
// including a side longer than kMaxBoardSide.
Board generateBoard(const GameParameters& params, Rng& rng);

} // namespace sweeper::core
