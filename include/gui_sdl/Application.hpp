#pragma once

#include <memory>
#include <string>

#include <SDL.h>

#include "gui_sdl/Screen.hpp"
#include "controller/GameConfig.hpp"

namespace sweeper::gui_sdl {

struct WindowSettings {
    std::string title{"Treasure Sweeper"};
    int width{900};
    int height{700};
};

// Room for a board of the configured size next to the HUD
WindowSettings windowSettingsFor(const controller::GameConfig& config);

// Owns the SDL window/renderer and the Dear ImGui context. Frames are drawn
// after input and at least every kIdleFrameMs so the game clock keeps moving.
class Application {
public:
    static constexpr Uint32 kIdleFrameMs = 250;

    Application() = default;
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool init(const WindowSettings& settings);
    int run();

    void requestQuit() { m_running = false; }

    // Takes effect between frames, so a screen may replace itself
    // while handling its own events.
    void setScreen(std::unique_ptr<Screen> screen);

    SDL_Renderer* renderer() const { return m_renderer; }
    void getWindowSize(int& w, int& h) const;

private:
    bool initImGui();
    void shutdown();

    void pumpEvents();
    void drawFrame(float dtSeconds);
    void switchScreenIfRequested();

private:
    bool m_running{false};
    bool m_imguiReady{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;
    std::unique_ptr<Screen> m_nextScreen;
};

} // namespace sweeper::gui_sdl
