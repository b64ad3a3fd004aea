#include "gui_sdl/Application.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace sweeper::gui_sdl {

namespace {

constexpr int kCellPx = 32;
constexpr int kHudPx = 280;
constexpr int kMarginPx = 40;

} // namespace

WindowSettings windowSettingsFor(const controller::GameConfig& config)
{
    WindowSettings settings;
    int rows = config.layoutPath.empty() ? config.rows : core::kTestBoardSize;
    int cols = config.layoutPath.empty() ? config.cols : core::kTestBoardSize;
    rows = std::clamp(rows, 1, core::kMaxBoardSide);
    cols = std::clamp(cols, 1, core::kMaxBoardSide);

    settings.width = std::clamp(cols * kCellPx + kHudPx + kMarginPx, 640, 1600);
    settings.height = std::clamp(rows * kCellPx + kMarginPx, 520, 1000);
    return settings;
}

Application::~Application() {
    shutdown();
}

bool Application::init(const WindowSettings& settings) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        std::fprintf(stderr, "[GUI] SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    m_window = SDL_CreateWindow(settings.title.c_str(),
                                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                settings.width, settings.height,
                                SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (m_window == nullptr) {
        std::fprintf(stderr, "[GUI] SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    // Vsync is enough; the loop idles between events anyway
    m_renderer = SDL_CreateRenderer(m_window, -1,
                                    SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (m_renderer == nullptr) {
        m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (m_renderer == nullptr) {
        std::fprintf(stderr, "[GUI] SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }

    if (!initImGui()) {
        return false;
    }

    m_running = true;
    return true;
}

bool Application::initImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsLight();

    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr; // nothing to remember between runs

    // Fonts[0] for widgets, Fonts[1] for cell digits and the end-of-game card
    io.Fonts->AddFontDefault();
    ImFontConfig big;
    big.SizePixels = 26.0f;
    io.Fonts->AddFontDefault(&big);

    if (!ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer)) {
        std::fprintf(stderr, "[GUI] ImGui SDL2 backend failed to start\n");
        ImGui::DestroyContext();
        return false;
    }
    if (!ImGui_ImplSDLRenderer2_Init(m_renderer)) {
        std::fprintf(stderr, "[GUI] ImGui renderer backend failed to start\n");
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    m_imguiReady = true;
    return true;
}

void Application::shutdown() {
    // Screens go first: they may still point at the renderer
    m_nextScreen.reset();
    m_screen.reset();

    if (m_imguiReady) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiReady = false;
    }

    if (m_renderer != nullptr) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window != nullptr) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    if (SDL_WasInit(0) != 0) {
        SDL_Quit();
    }
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    m_nextScreen = std::move(screen);
}

void Application::switchScreenIfRequested() {
    if (!m_nextScreen) return;

    m_screen = std::move(m_nextScreen);
    if (m_window != nullptr) {
        SDL_SetWindowTitle(m_window, m_screen->title());
    }
}

void Application::getWindowSize(int& w, int& h) const {
    w = 0;
    h = 0;
    if (m_window != nullptr) SDL_GetWindowSize(m_window, &w, &h);
}

void Application::pumpEvents() {
    // Block until something happens or the clock needs a redraw
    SDL_Event e;
    if (SDL_WaitEventTimeout(&e, static_cast<int>(kIdleFrameMs)) == 0) {
        return;
    }

    do {
        ImGui_ImplSDL2_ProcessEvent(&e);

        if (e.type == SDL_QUIT) {
            m_running = false;
        } else if (m_screen) {
            m_screen->handleEvent(*this, e);
        }
        switchScreenIfRequested();
    } while (SDL_PollEvent(&e) != 0);
}

void Application::drawFrame(float dtSeconds) {
    if (m_screen) {
        m_screen->update(*this, dtSeconds);
    }

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    SDL_SetRenderDrawColor(m_renderer, 190, 190, 190, 255);
    SDL_RenderClear(m_renderer);

    if (m_screen) {
        m_screen->render(*this);
    }

    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

int Application::run() {
    if (!m_running) {
        return 1;
    }
    switchScreenIfRequested();

    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    while (m_running) {
        const auto now = clock::now();
        drawFrame(std::chrono::duration<float>(now - last).count());
        last = now;

        switchScreenIfRequested();
        pumpEvents();
    }

    return 0;
}

} // namespace sweeper::gui_sdl
