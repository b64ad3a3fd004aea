#pragma once

#include "core/Snapshot.hpp"

namespace sweeper::controller {

// Notifications a front end may care about. Every hook has an empty default,
// so an adapter overrides only what it draws.
class CellObserver {
public:
    virtual ~CellObserver() = default;

    // One call per cell whose revealed/flagged state changed
    virtual void onCellChanged(const core::CellView& /*cell*/) {}

    virtual void onFlagCountChanged(int /*flagCount*/) {}

    // status is Won or Lost
    virtual void onGameOver(core::GameStatus /*status*/) {}

    // A new game was swapped in (restart or load)
    virtual void onRestart(const core::GameSnapshot& /*snapshot*/) {}
};

} // namespace sweeper::controller
