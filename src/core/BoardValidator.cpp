#include "core/BoardValidator.hpp"

#include <cctype>
#include <sstream>
#include <utility>

namespace sweeper::core {

namespace {

ValidationResult fail(ValidationRule rule, std::string message) {
    ValidationResult result;
    result.ok = false;
    result.rule = rule;
    result.message = std::move(message);
    return result;
}

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool isMine(const Layout& layout, int row, int col) {
    return layout[row][col] == static_cast<int>(CellContent::Mine);
}

// Stands in for a token that is not 0, 1 or 2
constexpr int kInvalidValue = -1;

int parseValue(const std::string& token) {
    if (token.size() != 1 || !std::isdigit(static_cast<unsigned char>(token[0]))) {
        return kInvalidValue;
    }
    return token[0] - '0';
}

const char* const kShapeMessage =
    "The board must have exactly 8 rows with exactly 8 values in each row.";
const char* const kValuesMessage =
    "Every value must be 0 (empty), 1 (mine) or 2 (treasure).";

} // namespace

ValidationResult validateLayout(const Layout& layout) {
    const int n = kTestBoardSize;

    // 1. Shape
    if (static_cast<int>(layout.size()) != n) {
        return fail(ValidationRule::Shape, kShapeMessage);
    }
    for (const auto& row : layout) {
        if (static_cast<int>(row.size()) != n) {
            return fail(ValidationRule::Shape, kShapeMessage);
        }
    }

    // 2. Values
    for (const auto& row : layout) {
        for (int value : row) {
            if (value < 0 || value > 2) {
                return fail(ValidationRule::Values, kValuesMessage);
            }
        }
    }

    // 3. Mine count
    int mines = 0;
    int treasures = 0;
    for (const auto& row : layout) {
        for (int value : row) {
            if (value == static_cast<int>(CellContent::Mine)) ++mines;
            if (value == static_cast<int>(CellContent::Treasure)) ++treasures;
        }
    }
    if (mines != kTestBoardMines) {
        return fail(ValidationRule::MineCount,
                    "The board must contain exactly 10 mines (found "
                    + std::to_string(mines) + ").");
    }

    // 4. Every row has a mine
    for (int r = 0; r < n; ++r) {
        bool found = false;
        for (int c = 0; c < n && !found; ++c) {
            found = isMine(layout, r, c);
        }
        if (!found) {
            return fail(ValidationRule::RowCoverage,
                        "Every row must contain at least one mine (row "
                        + std::to_string(r + 1) + " has none).");
        }
    }

    // 5. Every column has a mine
    for (int c = 0; c < n; ++c) {
        bool found = false;
        for (int r = 0; r < n && !found; ++r) {
            found = isMine(layout, r, c);
        }
        if (!found) {
            return fail(ValidationRule::ColumnCoverage,
                        "Every column must contain at least one mine (column "
                        + std::to_string(c + 1) + " has none).");
        }
    }

    // 6. Main diagonal
    int diagonal = 0;
    for (int i = 0; i < n; ++i) {
        if (isMine(layout, i, i)) ++diagonal;
    }
    if (diagonal != 1) {
        return fail(ValidationRule::Diagonal,
                    "Exactly one mine must lie on the main diagonal (found "
                    + std::to_string(diagonal) + ").");
    }

    // 7. Orthogonally adjacent pairs, each pair counted once
    int pairs = 0;
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            if (!isMine(layout, r, c)) continue;
            if (c + 1 < n && isMine(layout, r, c + 1)) ++pairs;
            if (r + 1 < n && isMine(layout, r + 1, c)) ++pairs;
        }
    }
    if (pairs != 1) {
        return fail(ValidationRule::AdjacentPair,
                    "Exactly one pair of mines must be horizontally or vertically adjacent (found "
                    + std::to_string(pairs) + ").");
    }

    // 8. Treasures
    if (treasures < 1 || treasures > kTestBoardMaxTreasures) {
        return fail(ValidationRule::TreasureCount,
                    "The board must contain between 1 and 9 treasures (found "
                    + std::to_string(treasures) + ").");
    }

    ValidationResult result;
    result.ok = true;
    result.rule = ValidationRule::None;
    result.message = "Board is valid.";
    result.layout = layout;
    return result;
}

ValidationResult parseLayout(const std::string& text) {
    Layout layout;

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) {
            continue;
        }

        std::vector<int> row;
        std::istringstream fields(line);
        std::string field;
        while (std::getline(fields, field, ',')) {
            row.push_back(parseValue(trim(field)));
        }
        // getline drops the empty field after a trailing separator
        if (trim(line).back() == ',') {
            row.push_back(kInvalidValue);
        }
        layout.push_back(std::move(row));
    }

    // Bad tokens become kInvalidValue so the shape rule is still checked first
    return validateLayout(layout);
}

} // namespace sweeper::core
