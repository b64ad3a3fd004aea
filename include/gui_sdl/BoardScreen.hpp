#pragma once

#include <memory>
#include <string>

#include "gui_sdl/Screen.hpp"
#include "controller/CellObserver.hpp"
#include "controller/GameConfig.hpp"
#include "controller/GameController.hpp"

namespace sweeper::gui_sdl {

class BoardScreen final : public Screen, public controller::CellObserver {
public:
    BoardScreen(std::unique_ptr<controller::GameController> gameController,
                controller::GameConfig config);
    ~BoardScreen() override;

    const char* title() const override { return "Treasure Sweeper"; }
    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

    // CellObserver
    void onCellChanged(const core::CellView& cell) override;
    void onFlagCountChanged(int flagCount) override;
    void onGameOver(core::GameStatus status) override;
    void onRestart(const core::GameSnapshot& snapshot) override;

private:
    struct Layout {
        int cell = 32;
        int boardX = 20;
        int boardY = 20;
        int boardW = 0;
        int boardH = 0;
        int hudX = 0;
        int hudY = 0;
    };

    Layout computeLayout(int windowW, int windowH) const;

    void renderBoard(SDL_Renderer* renderer, const Layout& L) const;
    void renderCellText(const Layout& L) const;
    void renderGameOverCard(const Layout& L) const;
    void renderHUD(Application& app, const Layout& L);

    // Board cell under a window pixel, false when outside the board
    bool cellAt(int px, int py, core::Position& out) const;

    void dispatch(controller::InputAction action, core::Position pos = {});

private:
    std::unique_ptr<controller::GameController> controller_;
    controller::GameConfig config_;

    core::GameSnapshot snapshot_;
    Layout layout_;

    std::string message_;
};

} // namespace sweeper::gui_sdl
