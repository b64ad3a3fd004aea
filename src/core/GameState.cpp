#include "core/GameState.hpp"
#include "core/Errors.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace sweeper::core {

GameState::GameState(GameParameters params, Rng& rng)
    : params_{std::move(params)}
    , board_{generateBoard(params_, rng)}
{
    // Fixed layouts decide their own counts
    params_.mineCount = board_.mineCount();
    params_.treasureCount = board_.treasureCount();
}

GameState::GameState(GameParameters params, Board board)
    : params_{std::move(params)}
    , board_{std::move(board)}
{
}

void GameState::ensureNotOver(const char* operation) const {
    if (isOver()) {
        throw IllegalOperation(std::string{"Cannot "} + operation + ": the game is over");
    }
}

RevealResult GameState::reveal(Position p, Clock::time_point now) {
    ensureNotOver("reveal");

    RevealResult result = revealCell(board_, p);
    if (result.outcome == RevealOutcome::AlreadyRevealedOrFlagged) {
        return result;
    }

    if (status_ == GameStatus::NotStarted) {
        status_ = GameStatus::InProgress;
        startedAt_ = now;
    }

    clickedCount_ += static_cast<int>(result.newlyRevealed.size());
    updateStatusAfterReveal(result.outcome);
    return result;
}

void GameState::updateStatusAfterReveal(RevealOutcome outcome) {
    switch (outcome) {
    case RevealOutcome::HitMine:
        status_ = GameStatus::Lost;
        break;
    case RevealOutcome::FoundTreasure:
        status_ = GameStatus::Won;
        break;
    case RevealOutcome::Revealed:
        if (clickedCount_ == safeCellTarget()) {
            status_ = GameStatus::Won;
        }
        break;
    case RevealOutcome::AlreadyRevealedOrFlagged:
        break;
    }
}

FlagOutcome GameState::toggleFlag(Position p) {
    ensureNotOver("toggle a flag");

    const FlagOutcome outcome = core::toggleFlag(board_, p);
    if (outcome == FlagOutcome::Flagged) {
        ++flagCount_;
    } else if (outcome == FlagOutcome::Unflagged) {
        --flagCount_;
    }
    return outcome;
}

GameState GameState::restart(Rng& rng) const {
    return GameState{params_, rng};
}

GameSnapshot GameState::snapshot() const {
    GameSnapshot snap;
    snap.rows = board_.rows();
    snap.cols = board_.cols();
    snap.cells.reserve(static_cast<std::size_t>(board_.cellCount()));

    for (int r = 0; r < board_.rows(); ++r) {
        for (int c = 0; c < board_.cols(); ++c) {
            const Cell& cell = board_.cell(r, c);
            snap.cells.push_back(CellView{
                r, c,
                cell.isRevealed,
                cell.isFlagged,
                cell.isMine,
                cell.hasTreasure,
                cell.adjacentMines
            });
        }
    }

    snap.flagCount = flagCount_;
    snap.mineCount = board_.mineCount();
    snap.treasureCount = board_.treasureCount();
    snap.clickedCount = clickedCount_;
    snap.status = status_;
    snap.startedAt = startedAt_;
    return snap;
}

std::chrono::seconds GameState::elapsed(Clock::time_point now) const {
    if (!startedAt_ || now < *startedAt_) {
        return std::chrono::seconds{0};
    }
    return std::chrono::duration_cast<std::chrono::seconds>(now - *startedAt_);
}

SavedGame GameState::save() const {
    SavedGame saved;
    saved.rows = board_.rows();
    saved.cols = board_.cols();
    saved.fixedLayout = board_.isFixedLayout();
    saved.cells.reserve(static_cast<std::size_t>(board_.cellCount()));

    for (int r = 0; r < board_.rows(); ++r) {
        for (int c = 0; c < board_.cols(); ++c) {
            const Cell& cell = board_.cell(r, c);
            saved.cells.push_back(SavedCell{
                cell.isMine, cell.hasTreasure, cell.isFlagged, cell.isRevealed
            });
        }
    }

    saved.clickedCount = clickedCount_;
    saved.flagCount = flagCount_;
    if (startedAt_) {
        saved.startedAtMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            startedAt_->time_since_epoch()).count();
    }
    return saved;
}

GameState GameState::restore(const SavedGame& saved) {
    if (saved.version != SavedGame::kFormatVersion) {
        throw ConfigurationError("Unsupported saved game version " + std::to_string(saved.version));
    }
    if (saved.rows <= 0 || saved.cols <= 0) {
        throw ConfigurationError("Saved board dimensions must be positive");
    }
    if (saved.rows > kMaxBoardSide || saved.cols > kMaxBoardSide) {
        throw ConfigurationError("Saved board is larger than " + std::to_string(kMaxBoardSide)
                                 + " cells per side");
    }
    if (static_cast<int>(saved.cells.size()) != saved.rows * saved.cols) {
        throw ConfigurationError("Saved board has " + std::to_string(saved.cells.size())
                                 + " cells, expected " + std::to_string(saved.rows * saved.cols));
    }

    std::vector<CellContent> contents;
    contents.reserve(saved.cells.size());

    int flagged = 0;
    int revealed = 0;
    int revealedMines = 0;
    int revealedTreasures = 0;

    for (const auto& cell : saved.cells) {
        if (cell.isMine && cell.hasTreasure) {
            throw ConfigurationError("Saved cell is both a mine and a treasure");
        }
        if (cell.isFlagged && cell.isRevealed) {
            throw ConfigurationError("Saved cell is both flagged and revealed");
        }

        contents.push_back(cell.isMine ? CellContent::Mine
                           : cell.hasTreasure ? CellContent::Treasure
                           : CellContent::Empty);

        if (cell.isFlagged) ++flagged;
        if (cell.isRevealed) {
            ++revealed;
            if (cell.isMine) ++revealedMines;
            if (cell.hasTreasure) ++revealedTreasures;
        }
    }

    if (flagged != saved.flagCount) {
        throw ConfigurationError("Saved flag count does not match flagged cells");
    }
    if (revealed != saved.clickedCount) {
        throw ConfigurationError("Saved clicked count does not match revealed cells");
    }
    if (revealedMines + revealedTreasures > 1) {
        throw ConfigurationError("Saved game continued after it was over");
    }

    Board board{saved.rows, saved.cols, contents, saved.fixedLayout};
    if (board.treasureCount() == 0) {
        throw ConfigurationError("Saved board has no treasure");
    }

    for (int r = 0; r < saved.rows; ++r) {
        for (int c = 0; c < saved.cols; ++c) {
            const SavedCell& cell = saved.cells[static_cast<std::size_t>(r * saved.cols + c)];
            if (cell.isRevealed) board.setRevealed(Position{r, c});
            if (cell.isFlagged) board.setFlagged(Position{r, c}, true);
        }
    }

    GameParameters params;
    params.rows = saved.rows;
    params.cols = saved.cols;
    params.mineCount = board.mineCount();
    params.treasureCount = board.treasureCount();
    if (saved.fixedLayout) {
        params.layout = board.toLayout();
    }

    GameState state{std::move(params), std::move(board)};
    state.clickedCount_ = saved.clickedCount;
    state.flagCount_ = saved.flagCount;
    if (saved.startedAtMs) {
        state.startedAt_ = Clock::time_point{std::chrono::milliseconds{*saved.startedAtMs}};
    }

    if (revealedMines > 0) {
        state.status_ = GameStatus::Lost;
    } else if (revealedTreasures > 0
               || (state.clickedCount_ > 0 && state.clickedCount_ == state.safeCellTarget())) {
        state.status_ = GameStatus::Won;
    } else if (state.clickedCount_ > 0 || state.startedAt_) {
        state.status_ = GameStatus::InProgress;
    } else {
        state.status_ = GameStatus::NotStarted;
    }

    return state;
}

std::string formatElapsed(std::chrono::seconds elapsed) {
    long long total = elapsed.count();
    if (total < 0) total = 0;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld",
                  total / 3600, (total / 60) % 60, total % 60);
    return buffer;
}

} // namespace sweeper::core
