#pragma once

#include "core/GameState.hpp"
#include "controller/CellObserver.hpp"
#include "controller/InputAction.hpp"
#include <cstdint>

namespace sweeper::controller {

class GameController {
public:
    /// Owns the game. Throws core::ConfigurationError on bad parameters.
    explicit GameController(core::GameParameters params);
    GameController(core::GameParameters params, std::uint32_t seed);

    /// Observer is not owned; pass nullptr to detach.
    void setObserver(CellObserver* observer) noexcept { observer_ = observer; }

    const core::GameState& game() const noexcept { return game_; }
    core::GameSnapshot snapshot() const { return game_.snapshot(); }

    // Direct engine calls. These throw core::InvalidCoordinate and
    // core::IllegalOperation like GameState does.
    core::RevealResult reveal(core::Position pos);
    core::FlagOutcome toggleFlag(core::Position pos);

    /// Replaces the game with a fresh one built from the same parameters.
    /// The new state is fully built before it is swapped in.
    void restart();

    // Called by UI or console loop when some input happens.
    // Recoverable engine errors come back as a status instead of an exception.
    ActionStatus handleAction(InputAction action, core::Position pos = {});

    core::SavedGame save() const { return game_.save(); }

    /// Throws core::ConfigurationError if saved is inconsistent; the current
    /// game is kept in that case.
    void load(const core::SavedGame& saved);

private:
    void notifyCells(const core::RevealResult& result);
    void notifyIfOver();

    core::Rng rng_;
    core::GameState game_;
    CellObserver* observer_{nullptr};
};

} // namespace sweeper::controller
