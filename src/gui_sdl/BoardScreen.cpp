#include "gui_sdl/BoardScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdint>
#include <cstdio>
#include <utility>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "core/GameState.hpp"

namespace sweeper::gui_sdl {

using core::GameStatus;

static ImU32 colorForDigit(int n)
{
    switch (n) {
        case 1: return IM_COL32(  0,   0, 255, 255);
        case 2: return IM_COL32(  0, 128,   0, 255);
        case 3: return IM_COL32(255,   0,   0, 255);
        case 4: return IM_COL32(  0,   0, 128, 255);
        case 5: return IM_COL32(128,   0,   0, 255);
        case 6: return IM_COL32(  0, 128, 128, 255);
        case 7: return IM_COL32(  0,   0,   0, 255);
        case 8: return IM_COL32(128, 128, 128, 255);
        default: break;
    }
    return IM_COL32(0, 0, 0, 255);
}

static const char* statusText(GameStatus status)
{
    switch (status) {
        case GameStatus::NotStarted: return "Ready";
        case GameStatus::InProgress: return "Playing";
        case GameStatus::Won:        return "You found a treasure!";
        case GameStatus::Lost:       return "Boom! You hit a mine.";
    }
    return "";
}

BoardScreen::BoardScreen(std::unique_ptr<controller::GameController> gameController,
                         controller::GameConfig config)
    : controller_(std::move(gameController))
    , config_(std::move(config))
{
    controller_->setObserver(this);
    snapshot_ = controller_->snapshot();
}

BoardScreen::~BoardScreen()
{
    if (controller_) controller_->setObserver(nullptr);
}

void BoardScreen::onCellChanged(const core::CellView& cell)
{
    if (cell.row < 0 || cell.row >= snapshot_.rows) return;
    if (cell.col < 0 || cell.col >= snapshot_.cols) return;
    snapshot_.cells[static_cast<std::size_t>(cell.row * snapshot_.cols + cell.col)] = cell;
}

void BoardScreen::onFlagCountChanged(int flagCount)
{
    snapshot_.flagCount = flagCount;
}

void BoardScreen::onGameOver(GameStatus status)
{
    // Full refresh so the end-of-game reveal sees every mine and treasure
    snapshot_ = controller_->snapshot();
    std::printf("[GAME] %s\n", statusText(status));
}

void BoardScreen::onRestart(const core::GameSnapshot& snapshot)
{
    snapshot_ = snapshot;
    message_.clear();
    std::printf("[GAME] New %dx%d board\n", snapshot.rows, snapshot.cols);
}

void BoardScreen::dispatch(controller::InputAction action, core::Position pos)
{
    using controller::ActionStatus;

    const ActionStatus result = controller_->handleAction(action, pos);
    switch (result) {
        case ActionStatus::Applied:
            message_.clear();
            break;
        case ActionStatus::NoEffect:
            break;
        case ActionStatus::OutOfBounds:
            message_ = "That cell is not on the board.";
            break;
        case ActionStatus::GameOver:
            message_ = "The game is over. Press Restart to play again.";
            break;
    }

    // Counters and timer are not carried by the cell hooks
    const auto fresh = controller_->snapshot();
    snapshot_.clickedCount = fresh.clickedCount;
    snapshot_.status = fresh.status;
    snapshot_.startedAt = fresh.startedAt;
}

BoardScreen::Layout BoardScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int rows = std::max(1, snapshot_.rows);
    const int cols = std::max(1, snapshot_.cols);

    const int margin = 20;
    const int hudW = 240;

    const int usableW = windowW - margin * 3 - hudW;
    const int usableH = windowH - margin * 2;

    int cell = std::min(usableW / cols, usableH / rows);
    cell = std::clamp(cell, 16, 48);

    L.cell = cell;
    L.boardW = cols * cell;
    L.boardH = rows * cell;

    const int groupW = L.boardW + margin + hudW;
    L.boardX = std::max(margin, (windowW - groupW) / 2);
    L.boardY = margin + std::max(0, (usableH - L.boardH) / 2);

    L.hudX = L.boardX + L.boardW + margin;
    L.hudY = L.boardY;
    return L;
}

bool BoardScreen::cellAt(int px, int py, core::Position& out) const
{
    const Layout& L = layout_;
    if (px < L.boardX || py < L.boardY) return false;
    if (px >= L.boardX + L.boardW || py >= L.boardY + L.boardH) return false;

    out.row = (py - L.boardY) / L.cell;
    out.col = (px - L.boardX) / L.cell;
    return true;
}

void BoardScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type == SDL_MOUSEBUTTONDOWN) {
        if (ImGui::GetIO().WantCaptureMouse) return;

        core::Position pos{};
        if (!cellAt(e.button.x, e.button.y, pos)) return;

        if (e.button.button == SDL_BUTTON_LEFT) {
            dispatch(controller::InputAction::Reveal, pos);
        } else if (e.button.button == SDL_BUTTON_RIGHT) {
            dispatch(controller::InputAction::ToggleFlag, pos);
        }
        return;
    }

    if (e.type == SDL_KEYDOWN && e.key.repeat == 0) {
        switch (e.key.keysym.sym) {
            case SDLK_n:
            case SDLK_F2:
                dispatch(controller::InputAction::Restart);
                break;
            case SDLK_ESCAPE:
            case SDLK_BACKSPACE:
                app.setScreen(std::make_unique<StartScreen>(config_));
                break;
            default:
                break;
        }
    }
}

void BoardScreen::update(Application& app, float)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);
    layout_ = computeLayout(winW, winH);
}

void BoardScreen::render(Application& app)
{
    renderBoard(app.renderer(), layout_);
    renderCellText(layout_);
    renderGameOverCard(layout_);
    renderHUD(app, layout_);
}

void BoardScreen::renderBoard(SDL_Renderer* renderer, const Layout& L) const
{
    const bool over = snapshot_.status == GameStatus::Won || snapshot_.status == GameStatus::Lost;

    SDL_SetRenderDrawColor(renderer, 120, 120, 120, 255);
    SDL_Rect boardRect{L.boardX, L.boardY, L.boardW, L.boardH};
    SDL_RenderFillRect(renderer, &boardRect);

    for (const auto& cell : snapshot_.cells) {
        SDL_Rect rct{L.boardX + cell.col * L.cell + 1, L.boardY + cell.row * L.cell + 1,
                     L.cell - 2, L.cell - 2};

        if (cell.revealed && cell.isMine) {
            SDL_SetRenderDrawColor(renderer, 220, 40, 40, 255);
        } else if (cell.revealed && cell.hasTreasure) {
            SDL_SetRenderDrawColor(renderer, 250, 210, 60, 255);
        } else if (cell.revealed) {
            SDL_SetRenderDrawColor(renderer, 225, 225, 225, 255);
        } else if (over && (cell.isMine || cell.hasTreasure)) {
            SDL_SetRenderDrawColor(renderer, 200, 200, 200, 255);
        } else {
            SDL_SetRenderDrawColor(renderer, 165, 170, 185, 255);
        }
        SDL_RenderFillRect(renderer, &rct);
    }
}

void BoardScreen::renderCellText(const Layout& L) const
{
    const bool over = snapshot_.status == GameStatus::Won || snapshot_.status == GameStatus::Lost;

    ImDrawList* dl = ImGui::GetForegroundDrawList();
    ImGuiIO& io = ImGui::GetIO();
    ImFont* bigFont = (io.Fonts->Fonts.Size > 1) ? io.Fonts->Fonts[1] : ImGui::GetFont();
    const float size = std::min(bigFont->FontSize, L.cell * 0.8f);

    for (const auto& cell : snapshot_.cells) {
        char text[4] = {0};
        ImU32 col = IM_COL32(0, 0, 0, 255);

        if (cell.flagged) {
            // After the game a flag on a non-mine is shown as a mistake
            const bool wrong = over && !cell.isMine;
            text[0] = wrong ? 'X' : 'F';
            col = wrong ? IM_COL32(160, 0, 0, 255) : IM_COL32(200, 0, 0, 255);
        } else if (cell.isMine && (cell.revealed || over)) {
            text[0] = 'M';
        } else if (cell.hasTreasure && (cell.revealed || over)) {
            text[0] = 'T';
            col = IM_COL32(140, 90, 0, 255);
        } else if (cell.revealed && cell.adjacentMines > 0) {
            std::snprintf(text, sizeof(text), "%d", cell.adjacentMines);
            col = colorForDigit(cell.adjacentMines);
        } else {
            continue;
        }

        const ImVec2 tSize = bigFont->CalcTextSizeA(size, FLT_MAX, 0.0f, text);
        const float cx = L.boardX + cell.col * L.cell + L.cell * 0.5f;
        const float cy = L.boardY + cell.row * L.cell + L.cell * 0.5f;
        dl->AddText(bigFont, size, ImVec2(cx - tSize.x * 0.5f, cy - tSize.y * 0.5f), col, text);
    }
}

void BoardScreen::renderGameOverCard(const Layout& L) const
{
    if (snapshot_.status != GameStatus::Won && snapshot_.status != GameStatus::Lost) return;

    const bool won = snapshot_.status == GameStatus::Won;
    const char* msg = won ? "YOU WIN" : "GAME OVER";
    const char* hint = "Press N or the Restart button";

    ImDrawList* dl = ImGui::GetForegroundDrawList();

    const float cx = L.boardX + L.boardW * 0.5f;
    const float cy = L.boardY + L.boardH * 0.5f;
    const float cardW = std::min(360.0f, L.boardW * 0.9f);
    const float cardH = 100.0f;

    ImVec2 p0(cx - cardW * 0.5f, cy - cardH * 0.5f);
    ImVec2 p1(cx + cardW * 0.5f, cy + cardH * 0.5f);
    dl->AddRectFilled(p0, p1, IM_COL32(0, 0, 0, 150), 10.0f);

    ImGuiIO& io = ImGui::GetIO();
    ImFont* bigFont = (io.Fonts->Fonts.Size > 1) ? io.Fonts->Fonts[1] : ImGui::GetFont();

    const ImVec2 tSize = bigFont->CalcTextSizeA(bigFont->FontSize, FLT_MAX, 0.0f, msg);
    dl->AddText(bigFont, bigFont->FontSize,
                ImVec2(cx - tSize.x * 0.5f, cy - 34.0f),
                won ? IM_COL32(255, 220, 80, 255) : IM_COL32(255, 255, 255, 255),
                msg);

    const ImVec2 hSize = ImGui::CalcTextSize(hint);
    dl->AddText(ImVec2(cx - hSize.x * 0.5f, cy + 14.0f), IM_COL32(220, 220, 220, 255), hint);
}

void BoardScreen::renderHUD(Application& app, const Layout& L)
{
    ImGui::SetNextWindowPos(ImVec2(static_cast<float>(L.hudX), static_cast<float>(L.hudY)),
                            ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(240, 0), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_AlwaysAutoResize;

    ImGui::Begin("Game", nullptr, flags);

    ImGui::Text("Level: %s", controller::levelName(config_.level));
    ImGui::Text("Time: %s", core::formatElapsed(controller_->game().elapsed()).c_str());
    ImGui::Separator();
    ImGui::Text("Mines: %d", snapshot_.mineCount);
    ImGui::Text("Flags: %d", snapshot_.flagCount);
    ImGui::Text("Treasures: %d", snapshot_.treasureCount);
    ImGui::Text("Cleared: %d / %d", snapshot_.clickedCount,
                controller_->game().safeCellTarget());
    ImGui::Separator();
    ImGui::TextWrapped("%s", statusText(snapshot_.status));

    if (!message_.empty()) {
        ImGui::TextColored(ImVec4(0.7f, 0.2f, 0.1f, 1.0f), "%s", message_.c_str());
    }

    ImGui::Spacing();
    if (ImGui::Button("Restart", ImVec2(-1, 0))) {
        dispatch(controller::InputAction::Restart);
    }
    if (ImGui::Button("Back to Menu", ImVec2(-1, 0))) {
        app.setScreen(std::make_unique<StartScreen>(config_));
    }

    ImGui::Separator();
    ImGui::TextDisabled("Left click: reveal");
    ImGui::TextDisabled("Right click: flag");
    ImGui::TextDisabled("N: restart   Esc: menu");

    ImGui::End();
}

} // namespace sweeper::gui_sdl
