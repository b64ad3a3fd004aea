#pragma once

#include <vector>

#include "core/Board.hpp"
#include "core/Types.hpp"

namespace fixtures {

// A test-mode board that passes every layout rule:
// 10 mines, one on the diagonal at (0,0), one adjacent pair (1,5)-(1,6),
// a single treasure in the bottom-right corner.
inline sweeper::core::Layout validLayout() {
    return {
        {1, 0, 0, 1, 0, 0, 0, 0},
        {0, 0, 0, 0, 0, 1, 1, 0},
        {0, 1, 0, 0, 0, 0, 0, 0},
        {0, 0, 0, 0, 1, 0, 0, 0},
        {0, 0, 0, 0, 0, 0, 0, 1},
        {0, 0, 1, 0, 0, 0, 0, 0},
        {0, 0, 0, 0, 0, 1, 0, 0},
        {0, 0, 0, 1, 0, 0, 0, 2},
    };
}

inline const char* validLayoutText() {
    return "1,0,0,1,0,0,0,0\n"
           "0,0,0,0,0,1,1,0\n"
           "0,1,0,0,0,0,0,0\n"
           "0,0,0,0,1,0,0,0\n"
           "0,0,0,0,0,0,0,1\n"
           "0,0,1,0,0,0,0,0\n"
           "0,0,0,0,0,1,0,0\n"
           "0,0,0,1,0,0,0,2\n";
}

// Builds a board straight from a 0/1/2 matrix
inline sweeper::core::Board boardFrom(const sweeper::core::Layout& layout) {
    std::vector<sweeper::core::CellContent> contents;
    for (const auto& row : layout) {
        for (int v : row) {
            contents.push_back(static_cast<sweeper::core::CellContent>(v));
        }
    }
    const int rows = static_cast<int>(layout.size());
    const int cols = rows > 0 ? static_cast<int>(layout.front().size()) : 0;
    return sweeper::core::Board{rows, cols, contents, true};
}

} // namespace fixtures
