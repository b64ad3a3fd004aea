#include <catch2/catch_test_macros.hpp>

#include "core/BoardValidator.hpp"
#include "BoardFixtures.hpp"

using namespace sweeper::core;

TEST_CASE("Validator accepts a well-formed test board", "[validator]") {
    const ValidationResult result = validateLayout(fixtures::validLayout());

    REQUIRE(result.ok);
    REQUIRE(result.rule == ValidationRule::None);
    REQUIRE(result.message == "Board is valid.");
    REQUIRE(result.layout == fixtures::validLayout());
}

TEST_CASE("Validator checks the shape first", "[validator]") {
    Layout layout = fixtures::validLayout();

    SECTION("seven rows") {
        layout.pop_back();
    }
    SECTION("nine values in a row") {
        layout[4].push_back(0);
    }
    SECTION("empty") {
        layout.clear();
    }

    const ValidationResult result = validateLayout(layout);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.rule == ValidationRule::Shape);
    REQUIRE(result.layout.empty());
}

TEST_CASE("Validator rejects unknown values", "[validator]") {
    Layout layout = fixtures::validLayout();
    layout[3][0] = 3;

    REQUIRE(validateLayout(layout).rule == ValidationRule::Values);
}

TEST_CASE("Validator requires exactly ten mines", "[validator]") {
    Layout layout = fixtures::validLayout();
    layout[3][4] = 0;

    const ValidationResult result = validateLayout(layout);
    REQUIRE(result.rule == ValidationRule::MineCount);
    REQUIRE(result.message == "The board must contain exactly 10 mines (found 9).");
}

TEST_CASE("Validator requires a mine in every row", "[validator]") {
    Layout layout = fixtures::validLayout();
    layout[2][1] = 0;
    layout[3][1] = 1;

    const ValidationResult result = validateLayout(layout);
    REQUIRE(result.rule == ValidationRule::RowCoverage);
    REQUIRE(result.message == "Every row must contain at least one mine (row 3 has none).");
}

TEST_CASE("Validator requires a mine in every column", "[validator]") {
    Layout layout = fixtures::validLayout();
    layout[2][1] = 0;
    layout[2][0] = 1;

    const ValidationResult result = validateLayout(layout);
    REQUIRE(result.rule == ValidationRule::ColumnCoverage);
    REQUIRE(result.message == "Every column must contain at least one mine (column 2 has none).");
}

TEST_CASE("Validator requires exactly one mine on the diagonal", "[validator]") {
    Layout layout = fixtures::validLayout();

    SECTION("two diagonal mines") {
        layout[1][6] = 0;
        layout[6][6] = 1;
        const ValidationResult result = validateLayout(layout);
        REQUIRE(result.rule == ValidationRule::Diagonal);
        REQUIRE(result.message == "Exactly one mine must lie on the main diagonal (found 2).");
    }
}

TEST_CASE("Validator requires exactly one adjacent pair", "[validator]") {
    Layout layout = fixtures::validLayout();

    SECTION("no pair") {
        layout[1][6] = 0;
        layout[2][6] = 1;
        const ValidationResult result = validateLayout(layout);
        REQUIRE(result.rule == ValidationRule::AdjacentPair);
        REQUIRE(result.message.find("(found 0)") != std::string::npos);
    }

    SECTION("two pairs") {
        layout[7][3] = 0;
        layout[7][5] = 1;
        const ValidationResult result = validateLayout(layout);
        REQUIRE(result.rule == ValidationRule::AdjacentPair);
        REQUIRE(result.message.find("(found 2)") != std::string::npos);
    }
}

TEST_CASE("Validator limits the number of treasures", "[validator]") {
    Layout layout = fixtures::validLayout();

    SECTION("none") {
        layout[7][7] = 0;
        const ValidationResult result = validateLayout(layout);
        REQUIRE(result.rule == ValidationRule::TreasureCount);
        REQUIRE(result.message == "The board must contain between 1 and 9 treasures (found 0).");
    }

    SECTION("ten") {
        for (int c = 0; c < 7; ++c) layout[4][c] = 2;
        layout[5][3] = 2;
        layout[5][4] = 2;
        const ValidationResult result = validateLayout(layout);
        REQUIRE(result.rule == ValidationRule::TreasureCount);
        REQUIRE(result.message.find("(found 10)") != std::string::npos);
    }

    SECTION("nine is still fine") {
        for (int c = 0; c < 7; ++c) layout[4][c] = 2;
        layout[5][3] = 2;
        REQUIRE(validateLayout(layout).ok);
    }
}

TEST_CASE("parseLayout reads comma-separated rows", "[validator][parse]") {
    const ValidationResult result = parseLayout(fixtures::validLayoutText());

    REQUIRE(result.ok);
    REQUIRE(result.layout == fixtures::validLayout());
}

TEST_CASE("parseLayout ignores blank lines and spaces", "[validator][parse]") {
    const std::string text =
        "\n"
        "1, 0, 0, 1, 0, 0, 0, 0\n"
        " 0,0,0,0,0,1,1,0 \n"
        "\n"
        "0,1,0,0,0,0,0,0\r\n"
        "0,0,0,0,1,0,0,0\n"
        "0,0,0,0,0,0,0,1\n"
        "0,0,1,0,0,0,0,0\n"
        "0,0,0,0,0,1,0,0\n"
        "0,0,0,1,0,0,0,2";

    REQUIRE(parseLayout(text).ok);
}

TEST_CASE("parseLayout reports bad tokens as bad values", "[validator][parse]") {
    std::string text = fixtures::validLayoutText();
    text.replace(text.find('0'), 1, "x");

    REQUIRE(parseLayout(text).rule == ValidationRule::Values);
}

TEST_CASE("parseLayout checks the shape before the values", "[validator][parse]") {
    REQUIRE(parseLayout("1,0,x\n0,1,0\n").rule == ValidationRule::Shape);
}

TEST_CASE("parseLayout counts a trailing comma as an extra field", "[validator][parse]") {
    std::string text = fixtures::validLayoutText();
    text.insert(text.find('\n'), ",");

    const ValidationResult result = parseLayout(text);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.rule == ValidationRule::Shape);
}
