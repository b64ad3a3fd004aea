#include <catch2/catch_test_macros.hpp>

#include "core/Board.hpp"
#include "core/Errors.hpp"
#include "core/Types.hpp"
#include "BoardFixtures.hpp"

using namespace sweeper::core;

TEST_CASE("Board counts mines and treasures", "[board]") {
    Board b = fixtures::boardFrom(fixtures::validLayout());

    REQUIRE(b.rows() == 8);
    REQUIRE(b.cols() == 8);
    REQUIRE(b.cellCount() == 64);
    REQUIRE(b.mineCount() == 10);
    REQUIRE(b.treasureCount() == 1);
    REQUIRE(b.treasureCells().front() == Position{7, 7});
    REQUIRE(b.isFixedLayout());
}

TEST_CASE("Board computes adjacency counts once", "[board]") {
    Board b = fixtures::boardFrom({
        {1, 0, 0},
        {0, 0, 1},
        {0, 0, 2},
    });

    CHECK(b.cell(0, 1).adjacentMines == 2);
    CHECK(b.cell(1, 1).adjacentMines == 2);
    CHECK(b.cell(2, 0).adjacentMines == 0);
    CHECK(b.cell(2, 1).adjacentMines == 1);
    // Treasure cells carry a count too
    CHECK(b.cell(2, 2).adjacentMines == 1);
    // A mine's count ignores itself
    CHECK(b.cell(0, 0).adjacentMines == 0);

    // Revealing does not touch the counts
    b.setRevealed(Position{1, 1});
    CHECK(b.cell(1, 1).adjacentMines == 2);
}

TEST_CASE("Board neighbours are clipped at the edges", "[board]") {
    Board b = fixtures::boardFrom({
        {0, 0, 0},
        {0, 0, 0},
        {0, 0, 2},
    });

    CHECK(b.neighbors(Position{0, 0}).size() == 3);
    CHECK(b.neighbors(Position{0, 1}).size() == 5);
    CHECK(b.neighbors(Position{1, 1}).size() == 8);
}

TEST_CASE("Board treasure adjacency excludes the treasure itself", "[board]") {
    Board b = fixtures::boardFrom({
        {0, 0, 0, 0},
        {0, 2, 0, 0},
        {0, 0, 0, 0},
        {0, 0, 0, 0},
    });

    CHECK(b.isAdjacentToTreasure(Position{0, 0}));
    CHECK(b.isAdjacentToTreasure(Position{2, 2}));
    CHECK_FALSE(b.isAdjacentToTreasure(Position{1, 1}));
    CHECK_FALSE(b.isAdjacentToTreasure(Position{3, 3}));
    CHECK_FALSE(b.isAdjacentToTreasure(Position{1, 3}));
}

TEST_CASE("Board rejects out-of-range coordinates", "[board]") {
    Board b = fixtures::boardFrom(fixtures::validLayout());

    REQUIRE_THROWS_AS(b.cell(-1, 0), InvalidCoordinate);
    REQUIRE_THROWS_AS(b.cell(0, 8), InvalidCoordinate);
    REQUIRE_THROWS_AS(b.setRevealed(Position{8, 8}), InvalidCoordinate);
    REQUIRE_THROWS_AS(b.setFlagged(Position{0, -1}, true), InvalidCoordinate);
    REQUIRE_FALSE(b.contains(Position{8, 0}));
}

TEST_CASE("Board rejects mismatching contents", "[board]") {
    std::vector<CellContent> contents(8, CellContent::Empty);

    REQUIRE_THROWS_AS((Board{3, 3, contents, false}), ConfigurationError);
    REQUIRE_THROWS_AS((Board{0, 8, contents, false}), ConfigurationError);
}

TEST_CASE("Board reproduces its layout", "[board]") {
    const Layout layout = fixtures::validLayout();
    Board b = fixtures::boardFrom(layout);

    b.setFlagged(Position{0, 0}, true);
    b.setRevealed(Position{0, 1});

    REQUIRE(b.toLayout() == layout);
}
