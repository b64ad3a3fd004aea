#pragma once

#include "Board.hpp"
#include "BoardGenerator.hpp"
#include "RevealEngine.hpp"
#include "SavedGame.hpp"
#include "Snapshot.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace sweeper::core {

class GameState {
public:
    // Builds a fresh board. Throws ConfigurationError on bad parameters.
    GameState(GameParameters params, Rng& rng);

    const Board& board() const noexcept { return board_; }
    const GameParameters& parameters() const noexcept { return params_; }

    GameStatus status() const noexcept { return status_; }
    bool isOver() const noexcept {
        return status_ == GameStatus::Won || status_ == GameStatus::Lost;
    }

    int clickedCount() const noexcept { return clickedCount_; }
    int flagCount() const noexcept { return flagCount_; }
    const std::optional<Clock::time_point>& startedAt() const noexcept { return startedAt_; }

    // Number of revealed safe cells that wins the game
    int safeCellTarget() const noexcept {
        return board_.cellCount() - board_.mineCount() - board_.treasureCount();
    }

    // Player actions. Both throw IllegalOperation once the game is over and
    // InvalidCoordinate for off-board positions; neither changes state then.
    RevealResult reveal(Position p, Clock::time_point now = Clock::now());
    FlagOutcome toggleFlag(Position p);

    // A new game from the same parameters (same layout when fixed).
    // This object is left untouched.
    GameState restart(Rng& rng) const;

    GameSnapshot snapshot() const;

    // Zero before the first reveal
    std::chrono::seconds elapsed(Clock::time_point now = Clock::now()) const;

    SavedGame save() const;

    // Throws ConfigurationError if the saved data is inconsistent
    static GameState restore(const SavedGame& saved);

private:
    GameState(GameParameters params, Board board);

    void updateStatusAfterReveal(RevealOutcome outcome);
    void ensureNotOver(const char* operation) const;

    GameParameters params_;
    Board board_;

    int clickedCount_{0};
    int flagCount_{0};
    std::optional<Clock::time_point> startedAt_;
    GameStatus status_{GameStatus::NotStarted};
};

// "HH:MM:SS", hours keep growing past 99
std::string formatElapsed(std::chrono::seconds elapsed);

} // namespace sweeper::core
