#include "gui_sdl/Application.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "controller/GameConfig.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto parsed = sweeper::controller::parseArguments(args);
    if (parsed.helpRequested) {
        std::cout << sweeper::controller::usage(argv[0]);
        return 0;
    }
    if (!parsed.ok) {
        std::cerr << "[CONFIG] " << parsed.error << "\n" << sweeper::controller::usage(argv[0]);
        return 2;
    }

    sweeper::gui_sdl::Application app;
    if (!app.init(sweeper::gui_sdl::windowSettingsFor(parsed.config))) {
        return 1;
    }

    // Command-line options only preselect the menu
    app.setScreen(std::make_unique<sweeper::gui_sdl::StartScreen>(parsed.config));
    return app.run();
}
