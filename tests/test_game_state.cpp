#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "core/Errors.hpp"
#include "core/GameState.hpp"
#include "BoardFixtures.hpp"

using namespace sweeper::core;
using namespace std::chrono_literals;

namespace {

GameParameters fixedParams() {
    GameParameters params;
    params.layout = fixtures::validLayout();
    return params;
}

} // namespace

TEST_CASE("GameState starts untouched", "[gamestate]") {
    Rng rng{1};
    GameState game{GameParameters{}, rng};

    REQUIRE(game.status() == GameStatus::NotStarted);
    REQUIRE(game.clickedCount() == 0);
    REQUIRE(game.flagCount() == 0);
    REQUIRE_FALSE(game.startedAt().has_value());
    REQUIRE(game.safeCellTarget() == 53);
    REQUIRE(game.elapsed() == 0s);
}

TEST_CASE("GameState takes mine and treasure counts from a fixed layout", "[gamestate]") {
    Rng rng{1};
    GameParameters params = fixedParams();
    params.mineCount = 1;
    params.treasureCount = 4;

    GameState game{params, rng};

    REQUIRE(game.parameters().mineCount == 10);
    REQUIRE(game.parameters().treasureCount == 1);
}

TEST_CASE("GameState first reveal starts the clock", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};
    const auto t0 = Clock::time_point{} + 1000s;

    game.reveal(Position{3, 0}, t0);

    REQUIRE(game.status() == GameStatus::InProgress);
    REQUIRE(game.startedAt().has_value());
    REQUIRE(*game.startedAt() == t0);
    REQUIRE(game.elapsed(t0 + 65s) == 65s);

    // Later reveals keep the original start time
    game.reveal(Position{6, 0}, t0 + 10s);
    REQUIRE(*game.startedAt() == t0);
}

TEST_CASE("GameState counts every newly revealed cell", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};

    const RevealResult r = game.reveal(Position{3, 0});
    REQUIRE(game.clickedCount() == static_cast<int>(r.newlyRevealed.size()));

    // Revealing again changes nothing
    const int before = game.clickedCount();
    const RevealResult again = game.reveal(Position{3, 0});
    REQUIRE(again.outcome == RevealOutcome::AlreadyRevealedOrFlagged);
    REQUIRE(game.clickedCount() == before);
}

TEST_CASE("GameState reveal of a flagged cell does not start the game", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};

    game.toggleFlag(Position{0, 0});
    const RevealResult r = game.reveal(Position{0, 0});

    REQUIRE(r.outcome == RevealOutcome::AlreadyRevealedOrFlagged);
    REQUIRE(game.status() == GameStatus::NotStarted);
    REQUIRE(game.clickedCount() == 0);
}

TEST_CASE("GameState is lost on a mine", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};

    const RevealResult r = game.reveal(Position{0, 0});

    REQUIRE(r.outcome == RevealOutcome::HitMine);
    REQUIRE(game.status() == GameStatus::Lost);
    REQUIRE(game.isOver());
    REQUIRE(game.board().cell(0, 0).isRevealed);

    REQUIRE_THROWS_AS(game.reveal(Position{3, 0}), IllegalOperation);
    REQUIRE_THROWS_AS(game.toggleFlag(Position{3, 0}), IllegalOperation);
    REQUIRE_FALSE(game.board().cell(3, 0).isRevealed);
}

TEST_CASE("GameState is won on a treasure", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};

    const RevealResult r = game.reveal(Position{7, 7});

    REQUIRE(r.outcome == RevealOutcome::FoundTreasure);
    REQUIRE(game.status() == GameStatus::Won);
    REQUIRE(game.clickedCount() == 1);
}

TEST_CASE("GameState is won once every safe cell is revealed", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};
    const Board& board = game.board();

    for (int r = 0; r < board.rows(); ++r) {
        for (int c = 0; c < board.cols(); ++c) {
            const Cell& cell = board.cell(r, c);
            if (cell.isMine || cell.hasTreasure || cell.isRevealed) continue;
            REQUIRE(game.status() != GameStatus::Won);
            game.reveal(Position{r, c});
        }
    }

    REQUIRE(game.clickedCount() == 53);
    REQUIRE(game.status() == GameStatus::Won);
    REQUIRE_FALSE(board.cell(7, 7).isRevealed);
}

TEST_CASE("GameState flag count follows toggles", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};

    REQUIRE(game.toggleFlag(Position{0, 0}) == FlagOutcome::Flagged);
    REQUIRE(game.flagCount() == 1);
    REQUIRE(game.toggleFlag(Position{0, 0}) == FlagOutcome::Unflagged);
    REQUIRE(game.flagCount() == 0);

    // Flags may exceed the mine count
    for (int c = 0; c < 8; ++c) {
        game.toggleFlag(Position{2, c});
        game.toggleFlag(Position{3, c});
    }
    REQUIRE(game.flagCount() == 16);

    // Flagging does not start the clock
    REQUIRE(game.status() == GameStatus::NotStarted);
}

TEST_CASE("GameState rejects off-board actions without changing state", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};

    REQUIRE_THROWS_AS(game.reveal(Position{-1, 0}), InvalidCoordinate);
    REQUIRE_THROWS_AS(game.toggleFlag(Position{0, 8}), InvalidCoordinate);
    REQUIRE(game.status() == GameStatus::NotStarted);
    REQUIRE(game.flagCount() == 0);
}

TEST_CASE("GameState restart keeps parameters and resets progress", "[gamestate]") {
    Rng rng{5};

    SECTION("fixed layout is reused") {
        GameState game{fixedParams(), rng};
        game.toggleFlag(Position{0, 0});
        game.reveal(Position{7, 7});

        const GameState fresh = game.restart(rng);

        REQUIRE(fresh.status() == GameStatus::NotStarted);
        REQUIRE(fresh.clickedCount() == 0);
        REQUIRE(fresh.flagCount() == 0);
        REQUIRE_FALSE(fresh.startedAt().has_value());
        REQUIRE(fresh.board().toLayout() == fixtures::validLayout());

        // The old game is untouched
        REQUIRE(game.status() == GameStatus::Won);
        REQUIRE(game.flagCount() == 1);
    }

    SECTION("random layout keeps its counts") {
        GameParameters params;
        params.rows = 16;
        params.cols = 16;
        params.mineCount = 40;
        params.treasureCount = 2;
        GameState game{params, rng};

        const GameState fresh = game.restart(rng);
        REQUIRE(fresh.board().rows() == 16);
        REQUIRE(fresh.board().mineCount() == 40);
        REQUIRE(fresh.board().treasureCount() == 2);
    }
}

TEST_CASE("GameState snapshot copies the visible state", "[gamestate]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};
    game.toggleFlag(Position{0, 0});
    game.reveal(Position{3, 0});

    const GameSnapshot snap = game.snapshot();

    REQUIRE(snap.rows == 8);
    REQUIRE(snap.cols == 8);
    REQUIRE(snap.cells.size() == 64);
    REQUIRE(snap.flagCount == 1);
    REQUIRE(snap.mineCount == 10);
    REQUIRE(snap.treasureCount == 1);
    REQUIRE(snap.clickedCount == game.clickedCount());
    REQUIRE(snap.status == GameStatus::InProgress);
    REQUIRE(snap.at(0, 0).flagged);
    REQUIRE(snap.at(3, 0).revealed);
    REQUIRE(snap.at(7, 7).hasTreasure);
}

TEST_CASE("GameState save and restore keep progress", "[gamestate][save]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};
    const auto t0 = Clock::time_point{} + 5000s;
    game.toggleFlag(Position{0, 0});
    game.reveal(Position{3, 0}, t0);

    const SavedGame saved = game.save();
    REQUIRE(saved.fixedLayout);
    REQUIRE(saved.startedAtMs.has_value());

    const GameState restored = GameState::restore(saved);

    REQUIRE(restored.status() == GameStatus::InProgress);
    REQUIRE(restored.clickedCount() == game.clickedCount());
    REQUIRE(restored.flagCount() == 1);
    REQUIRE(*restored.startedAt() == t0);
    REQUIRE(restored.board().toLayout() == fixtures::validLayout());
    REQUIRE(restored.board().cell(3, 0).isRevealed);
    REQUIRE(restored.board().cell(0, 0).isFlagged);
    REQUIRE(restored.board().cell(1, 1).adjacentMines == game.board().cell(1, 1).adjacentMines);
}

TEST_CASE("GameState restore derives a finished status", "[gamestate][save]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};
    game.reveal(Position{0, 0});

    const GameState restored = GameState::restore(game.save());
    REQUIRE(restored.status() == GameStatus::Lost);

    GameState won{fixedParams(), rng};
    won.reveal(Position{7, 7});
    REQUIRE(GameState::restore(won.save()).status() == GameStatus::Won);

    const GameState untouched = GameState::restore(GameState{fixedParams(), rng}.save());
    REQUIRE(untouched.status() == GameStatus::NotStarted);
}

TEST_CASE("GameState restore rejects inconsistent data", "[gamestate][save]") {
    Rng rng{1};
    GameState game{fixedParams(), rng};
    game.toggleFlag(Position{0, 0});
    game.reveal(Position{3, 0});
    SavedGame saved = game.save();

    SECTION("flag count") {
        saved.flagCount = 3;
        REQUIRE_THROWS_AS(GameState::restore(saved), ConfigurationError);
    }

    SECTION("clicked count") {
        saved.clickedCount += 1;
        REQUIRE_THROWS_AS(GameState::restore(saved), ConfigurationError);
    }

    SECTION("mine and treasure in one cell") {
        saved.cells[63].isMine = true;
        REQUIRE_THROWS_AS(GameState::restore(saved), ConfigurationError);
    }

    SECTION("flagged and revealed cell") {
        saved.cells[3 * 8].isFlagged = true;
        saved.flagCount += 1;
        REQUIRE_THROWS_AS(GameState::restore(saved), ConfigurationError);
    }

    SECTION("cell count") {
        saved.cells.pop_back();
        REQUIRE_THROWS_AS(GameState::restore(saved), ConfigurationError);
    }

    SECTION("version") {
        saved.version = SavedGame::kFormatVersion + 1;
        REQUIRE_THROWS_AS(GameState::restore(saved), ConfigurationError);
    }

    SECTION("oversized board") {
        saved.rows = 65536;
        saved.cols = 65537;
        REQUIRE_THROWS_AS(GameState::restore(saved), ConfigurationError);
    }
}

TEST_CASE("formatElapsed prints hours, minutes and seconds", "[gamestate]") {
    CHECK(formatElapsed(0s) == "00:00:00");
    CHECK(formatElapsed(59s) == "00:00:59");
    CHECK(formatElapsed(3725s) == "01:02:05");
    CHECK(formatElapsed(100h) == "100:00:00");
}
