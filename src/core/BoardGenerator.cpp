#include "core/BoardGenerator.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <numeric>
#include <string>

namespace sweeper::core {

namespace {

Board generateFixed(const GameParameters& params) {
    const Layout& layout = *params.layout;

    if (static_cast<int>(layout.size()) != params.rows) {
        throw ConfigurationError("Layout has " + std::to_string(layout.size())
                                 + " rows, expected " + std::to_string(params.rows));
    }

    std::vector<CellContent> contents;
    contents.reserve(static_cast<std::size_t>(params.rows) * params.cols);

    int treasures = 0;
    for (const auto& row : layout) {
        if (static_cast<int>(row.size()) != params.cols) {
            throw ConfigurationError("Layout row has " + std::to_string(row.size())
                                     + " values, expected " + std::to_string(params.cols));
        }
        for (int value : row) {
            switch (value) {
            case 0: contents.push_back(CellContent::Empty);    break;
            case 1: contents.push_back(CellContent::Mine);     break;
            case 2: contents.push_back(CellContent::Treasure); ++treasures; break;
            default:
                throw ConfigurationError("Layout value " + std::to_string(value)
                                         + " is not 0, 1 or 2");
            }
        }
    }

    if (treasures == 0) {
        throw ConfigurationError("Layout must contain at least one treasure");
    }

    return Board{params.rows, params.cols, contents, true};
}

Board generateRandom(const GameParameters& params, Rng& rng) {
    const int cells = params.rows * params.cols;

    if (params.mineCount < 0) {
        throw ConfigurationError("Mine count must not be negative");
    }
    if (params.treasureCount < 1) {
        throw ConfigurationError("At least one treasure is required");
    }
    if (params.mineCount + params.treasureCount >= cells) {
        throw ConfigurationError("Not enough cells for " + std::to_string(params.mineCount)
                                 + " mines and " + std::to_string(params.treasureCount)
                                 + " treasures on a " + std::to_string(params.rows) + "x"
                                 + std::to_string(params.cols) + " board");
    }

    // A uniform shuffle of all indices: the first mineCount become mines,
    // the next treasureCount (all non-mine by construction) become treasures.
    std::vector<int> order(cells);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<CellContent> contents(cells, CellContent::Empty);
    for (int i = 0; i < params.mineCount; ++i) {
        contents[order[i]] = CellContent::Mine;
    }
    for (int i = params.mineCount; i < params.mineCount + params.treasureCount; ++i) {
        contents[order[i]] = CellContent::Treasure;
    }

    return Board{params.rows, params.cols, contents, false};
}

} // namespace

Board generateBoard(const GameParameters& params, Rng& rng) {
    if (params.rows <= 0 || params.cols <= 0) {
        throw ConfigurationError("Board dimensions must be positive");
    }
    if (params.rows > kMaxBoardSide || params.cols > kMaxBoardSide) {
        throw ConfigurationError("Board dimensions must not exceed " + std::to_string(kMaxBoardSide)
                                 + ", got " + std::to_string(params.rows) + "x"
                                 + std::to_string(params.cols));
    }

    if (params.layout) {
        return generateFixed(params);
    }
    return generateRandom(params, rng);
}

} // namespace sweeper::core
