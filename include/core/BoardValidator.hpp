#pragma once

#include "Types.hpp"
#include <cstdint>
#include <string>

namespace sweeper::core {

// Shape of a test-mode board
inline constexpr int kTestBoardSize = 8;
inline constexpr int kTestBoardMines = 10;
inline constexpr int kTestBoardMaxTreasures = 9;

// Rules in the order they are checked
enum class ValidationRule : std::uint8_t {
    None,            // all rules passed
    Shape,           // 8 rows of 8 values
    Values,          // every value is 0, 1 or 2
    MineCount,       // exactly 10 mines
    RowCoverage,     // a mine in every row
    ColumnCoverage,  // a mine in every column
    Diagonal,        // exactly one mine where row == col
    AdjacentPair,    // exactly one edge-sharing pair of mines
    TreasureCount    // 1..9 treasures
};

struct ValidationResult {
    bool ok{false};
    ValidationRule rule{ValidationRule::None};
    std::string message;
    Layout layout; // the accepted matrix, empty on failure
};

// Checks a test-mode board. Stops at the first broken rule. No side effects.
ValidationResult validateLayout(const Layout& layout);

// Parses a comma-separated text table then runs validateLayout.
// Blank lines are skipped and spaces around values are ignored.
ValidationResult parseLayout(const std::string& text);

} // namespace sweeper::core
