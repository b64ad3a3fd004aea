#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace sweeper::core {

struct SavedCell {
    bool isMine{false};
    bool hasTreasure{false};
    bool isFlagged{false};
    bool isRevealed{false};
};

/// Persisted shape of an in-progress game. Independent from Board/GameState
/// internals; bump kFormatVersion whenever the fields change.
/// Adjacency counts are not stored: they are recomputed from the mines.
struct SavedGame {
    static constexpr std::uint32_t kFormatVersion = 1;

    std::uint32_t version{kFormatVersion};
    int rows{};
    int cols{};
    bool fixedLayout{false};
    std::vector<SavedCell> cells; // row-major, rows * cols

    int clickedCount{};
    int flagCount{};
    std::optional<std::int64_t> startedAtMs; // ms since the Unix epoch
};

} // namespace sweeper::core
