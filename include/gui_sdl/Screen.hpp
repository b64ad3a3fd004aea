#pragma once

#include <SDL.h>

namespace sweeper::gui_sdl {

class Application;

// One page of the GUI (level selection, board). The Application owns the
// current screen and forwards the frame loop to it.
class Screen {
public:
    virtual ~Screen() = default;

    // Shown in the window title bar
    virtual const char* title() const = 0;

    // Mouse/keyboard/window events, after ImGui has seen them
    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Per-frame logic (timers, deferred screen switches)
    virtual void update(Application& app, float dtSeconds) = 0;

    // SDL drawing first, ImGui widgets on top
    virtual void render(Application& app) = 0;
};

} // namespace sweeper::gui_sdl
