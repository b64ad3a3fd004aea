#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <random> // For std::mt19937
#include <vector>

// Namespace for Treasure Sweeper core types
namespace sweeper::core {

// Position structure representing a cell in the grid
struct Position {
    int row{};
    int col{};
};

inline bool operator==(const Position& a, const Position& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Position& a, const Position& b) {
    return !(a == b);
}

// What a cell holds after placement. Values match the fixed layout format.
enum class CellContent : std::uint8_t {
    Empty    = 0,
    Mine     = 1,
    Treasure = 2
};

// Rectangular matrix of CellContent values (0, 1, 2), one inner vector per row
using Layout = std::vector<std::vector<int>>;

// Largest accepted row or column count for any board
constexpr int kMaxBoardSide = 1000;

// Random source handed to the generator. Seed it for deterministic boards.
using Rng = std::mt19937;

} // namespace sweeper::core
