#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace sweeper::core {

enum class GameStatus : std::uint8_t {
    NotStarted,
    InProgress,
    Won,
    Lost
};

using Clock = std::chrono::system_clock;

// Read-only copy of one cell for presenters
struct CellView {
    int row{};
    int col{};
    bool revealed{false};
    bool flagged{false};
    bool isMine{false};
    bool hasTreasure{false};
    int adjacentMines{0};
};

// Everything a front end needs to draw a frame. Holds copies only, so it
// stays valid after the game moves on or is restarted.
struct GameSnapshot {
    int rows{};
    int cols{};
    std::vector<CellView> cells; // row-major

    int flagCount{};
    int mineCount{};
    int treasureCount{};
    int clickedCount{};
    GameStatus status{GameStatus::NotStarted};
    std::optional<Clock::time_point> startedAt;

    const CellView& at(int row, int col) const { return cells.at(row * cols + col); }
};

} // namespace sweeper::core
