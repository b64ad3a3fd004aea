#pragma once

#include <cstdint>

#include "core/Types.hpp"

namespace sweeper::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: mouse, keyboard, console commands, etc.
enum class InputAction {
    Reveal,
    ToggleFlag,
    Restart
};

// How the controller handled one action
enum class ActionStatus : std::uint8_t {
    Applied,     // state changed
    NoEffect,    // cell already revealed / flagged, nothing to do
    OutOfBounds, // position not on the board
    GameOver     // game already Won or Lost
};

// Console coordinates start at 1. Values below 1 map to a position that is
// off every board, so the controller reports OutOfBounds.
inline core::Position fromOneBased(int row, int col) {
    if (row < 1 || col < 1) {
        return core::Position{-1, -1};
    }
    return core::Position{row - 1, col - 1};
}

} // namespace sweeper::controller
