#include "controller/GameController.hpp"
#include "core/Errors.hpp"

#include <random>
#include <utility>

namespace sweeper::controller {

GameController::GameController(core::GameParameters params)
    : GameController{std::move(params), std::random_device{}()}
{
}

GameController::GameController(core::GameParameters params, std::uint32_t seed)
    : rng_{seed}
    , game_{std::move(params), rng_}
{
}

core::RevealResult GameController::reveal(core::Position pos) {
    core::RevealResult result = game_.reveal(pos);
    notifyCells(result);
    notifyIfOver();
    return result;
}

core::FlagOutcome GameController::toggleFlag(core::Position pos) {
    const core::FlagOutcome outcome = game_.toggleFlag(pos);
    if (observer_ && outcome != core::FlagOutcome::IgnoredRevealed) {
        const auto& cell = game_.board().cell(pos);
        observer_->onCellChanged(core::CellView{
            pos.row, pos.col, cell.isRevealed, cell.isFlagged,
            cell.isMine, cell.hasTreasure, cell.adjacentMines
        });
        observer_->onFlagCountChanged(game_.flagCount());
    }
    return outcome;
}

void GameController::restart() {
    // Build first: if generation throws, the running game stays as it was
    core::GameState fresh = game_.restart(rng_);
    game_ = std::move(fresh);

    if (observer_) {
        observer_->onRestart(game_.snapshot());
    }
}

void GameController::load(const core::SavedGame& saved) {
    core::GameState restored = core::GameState::restore(saved);
    game_ = std::move(restored);

    if (observer_) {
        observer_->onRestart(game_.snapshot());
    }
}

ActionStatus GameController::handleAction(InputAction action, core::Position pos) {
    switch (action) {
    case InputAction::Reveal:
        try {
            const auto result = reveal(pos);
            return result.outcome == core::RevealOutcome::AlreadyRevealedOrFlagged
                ? ActionStatus::NoEffect
                : ActionStatus::Applied;
        } catch (const core::InvalidCoordinate&) {
            return ActionStatus::OutOfBounds;
        } catch (const core::IllegalOperation&) {
            return ActionStatus::GameOver;
        }

    case InputAction::ToggleFlag:
        try {
            const auto outcome = toggleFlag(pos);
            return outcome == core::FlagOutcome::IgnoredRevealed
                ? ActionStatus::NoEffect
                : ActionStatus::Applied;
        } catch (const core::InvalidCoordinate&) {
            return ActionStatus::OutOfBounds;
        } catch (const core::IllegalOperation&) {
            return ActionStatus::GameOver;
        }

    case InputAction::Restart:
        restart();
        return ActionStatus::Applied;
    }

    return ActionStatus::NoEffect;
}

void GameController::notifyCells(const core::RevealResult& result) {
    if (!observer_) return;

    for (const auto& pos : result.newlyRevealed) {
        const auto& cell = game_.board().cell(pos);
        observer_->onCellChanged(core::CellView{
            pos.row, pos.col, cell.isRevealed, cell.isFlagged,
            cell.isMine, cell.hasTreasure, cell.adjacentMines
        });
    }
}

void GameController::notifyIfOver() {
    if (observer_ && game_.isOver()) {
        observer_->onGameOver(game_.status());
    }
}

} // namespace sweeper::controller
