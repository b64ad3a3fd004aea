#pragma once

#include "gui_sdl/Screen.hpp"
#include "controller/GameConfig.hpp"

#include <string>

namespace sweeper::gui_sdl {

// Level picker and test-mode layout loader
class StartScreen final : public Screen {
public:
    StartScreen();
    explicit StartScreen(const controller::GameConfig& initial);

    const char* title() const override { return "Treasure Sweeper"; }
    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    void startGame(Application& app);

    controller::GameConfig cfg_;

    // UI buffers
    int levelIndex_{0}; // index into the preset list, last entry = Custom
    int rows_{8};
    int cols_{8};
    int mines_{10};
    int treasures_{1};
    bool useSeed_{false};
    int seed_{0};
    bool testMode_{false};
    char layoutPathBuf_[512]{};

    std::string error_;
};

} // namespace sweeper::gui_sdl
