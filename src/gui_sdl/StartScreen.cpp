#include "gui_sdl/StartScreen.hpp"
#include "gui_sdl/Application.hpp"
#include "gui_sdl/BoardScreen.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>

#include <imgui.h>

#include "core/Errors.hpp"
#include "controller/GameController.hpp"

namespace sweeper::gui_sdl {

namespace {

constexpr controller::Level kLevels[] = {
    controller::Level::Beginner,
    controller::Level::Intermediate,
    controller::Level::Expert,
    controller::Level::Classic,
    controller::Level::Custom
};

constexpr const char* kLevelLabels[] = {
    "Beginner (8x8, 10 mines, 1 treasure)",
    "Intermediate (16x16, 40 mines, 2 treasures)",
    "Expert (16x30, 99 mines, 3 treasures)",
    "Classic (10x10, 10 mines, 1 treasure)",
    "Custom"
};

} // namespace

StartScreen::StartScreen()
    : StartScreen{controller::presetFor(controller::Level::Beginner)}
{
}

StartScreen::StartScreen(const controller::GameConfig& initial)
    : cfg_{initial}
{
    for (int i = 0; i < IM_ARRAYSIZE(kLevels); ++i) {
        if (kLevels[i] == cfg_.level) levelIndex_ = i;
    }
    rows_ = cfg_.rows;
    cols_ = cfg_.cols;
    mines_ = cfg_.mineCount;
    treasures_ = cfg_.treasureCount;
    useSeed_ = cfg_.seed.has_value();
    seed_ = static_cast<int>(cfg_.seed.value_or(0));
    testMode_ = !cfg_.layoutPath.empty();

    std::strncpy(layoutPathBuf_, cfg_.layoutPath.c_str(), sizeof(layoutPathBuf_) - 1);
    layoutPathBuf_[sizeof(layoutPathBuf_) - 1] = '\0';
}

void StartScreen::handleEvent(Application& app, const SDL_Event& e) {
    if (e.type == SDL_KEYDOWN && e.key.repeat == 0 && e.key.keysym.sym == SDLK_RETURN) {
        startGame(app);
    }
}

void StartScreen::update(Application&, float) {
    // Nothing animates here
}

void StartScreen::startGame(Application& app)
{
    // Build config from UI fields
    const controller::Level level = kLevels[levelIndex_];
    cfg_ = controller::presetFor(level);
    if (level == controller::Level::Custom) {
        cfg_.rows = rows_;
        cfg_.cols = cols_;
        cfg_.mineCount = mines_;
        cfg_.treasureCount = treasures_;
    }
    if (useSeed_) {
        cfg_.seed = static_cast<std::uint32_t>(seed_);
    }

    std::optional<core::Layout> layout;
    if (testMode_) {
        cfg_.layoutPath = layoutPathBuf_;
        const auto validation = controller::loadLayoutFile(cfg_.layoutPath);
        if (!validation.ok) {
            error_ = validation.message;
            std::fprintf(stderr, "[CONFIG] Rejected layout %s: %s\n",
                         cfg_.layoutPath.c_str(), validation.message.c_str());
            return;
        }
        layout = validation.layout;
    }

    try {
        const auto params = controller::toParameters(cfg_, layout);
        auto gameController = cfg_.seed
            ? std::make_unique<controller::GameController>(params, *cfg_.seed)
            : std::make_unique<controller::GameController>(params);
        app.setScreen(std::make_unique<BoardScreen>(std::move(gameController), cfg_));
    } catch (const core::ConfigurationError& ex) {
        error_ = ex.what();
        std::fprintf(stderr, "[CONFIG] %s\n", ex.what());
    }
}

void StartScreen::render(Application& app)
{
    int w = 0, h = 0;
    app.getWindowSize(w, h);

    ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(480, 0), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_AlwaysAutoResize;

    ImGui::Begin("Treasure Sweeper", nullptr, flags);

    ImGui::TextWrapped("Find a treasure without stepping on a mine. "
                       "Empty areas open up by themselves, but never next to a treasure.");
    ImGui::Separator();

    ImGui::BeginDisabled(testMode_);
    for (int i = 0; i < IM_ARRAYSIZE(kLevelLabels); ++i) {
        ImGui::RadioButton(kLevelLabels[i], &levelIndex_, i);
    }

    if (kLevels[levelIndex_] == controller::Level::Custom) {
        ImGui::InputInt("Rows", &rows_);
        ImGui::InputInt("Columns", &cols_);
        ImGui::InputInt("Mines", &mines_);
        ImGui::InputInt("Treasures", &treasures_);
        rows_ = std::clamp(rows_, 1, 30);
        cols_ = std::clamp(cols_, 1, 30);
        mines_ = std::max(mines_, 0);
        treasures_ = std::max(treasures_, 1);
    }
    ImGui::EndDisabled();

    ImGui::Spacing();
    ImGui::Checkbox("Fixed seed", &useSeed_);
    if (useSeed_) {
        ImGui::SameLine();
        ImGui::InputInt("##seed", &seed_);
        seed_ = std::max(seed_, 0);
    }

    ImGui::Checkbox("Test mode (8x8 layout file)", &testMode_);
    if (testMode_) {
        ImGui::InputText("Layout file", layoutPathBuf_, IM_ARRAYSIZE(layoutPathBuf_));
    }

    if (!error_.empty()) {
        ImGui::Spacing();
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextColored(ImVec4(0.8f, 0.1f, 0.1f, 1.0f), "%s", error_.c_str());
        ImGui::PopTextWrapPos();
    }

    ImGui::Separator();

    if (ImGui::Button("Start", ImVec2(160, 36))) {
        startGame(app);
    }
    ImGui::SameLine();
    if (ImGui::Button("Quit", ImVec2(120, 36))) {
        app.requestQuit();
    }

    ImGui::End();
}

} // namespace sweeper::gui_sdl
