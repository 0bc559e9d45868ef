#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>
#include <SDL2/SDL_main.h>
#include <SDL2/SDL_ttf.h>

#include "gemgrid/app/Bootstrap.hpp"
#include "gemgrid/core/Board.hpp"
#include "gemgrid/core/BoardLayout.hpp"
#include "gemgrid/core/GameConfig.hpp"
#include "gemgrid/core/Selection.hpp"
#include "gemgrid/platform/SdlInput.hpp"
#include "gemgrid/render/BoardView.hpp"
#include "gemgrid/render/SceneRenderer.hpp"

using gemgrid::core::InputOutcome;
using gemgrid::core::TickOutcome;
using gemgrid::platform::InputEventType;
using gemgrid::platform::KeyCode;
using gemgrid::platform::MouseButton;
using gemgrid::platform::SdlInput;
using gemgrid::render::BoardView;
using gemgrid::render::PanelInfo;

namespace {

constexpr int kPanelWidthPx = 360;
constexpr int kMarginPx = 40;
// Large hitches would otherwise finish a swap in a single frame.
constexpr float kMaxFrameSeconds = 0.1f;

struct SessionInfo {
    std::uint32_t seed = 0;
    gemgrid::core::ShuffleStats shuffle{};
    std::string status = "Select a tile";
};

std::string DescribeOutcome(const gemgrid::core::StateTransition& transition) {
    switch (transition.outcome) {
        case InputOutcome::Selected:
        case InputOutcome::Reselected:
            return "Select a neighbour to swap";
        case InputOutcome::Unchanged:
            return "Tile already selected";
        case InputOutcome::Swapped:
            return std::string("Swapped ") + gemgrid::core::SwapAxisName(transition.axis) + "ly";
        case InputOutcome::SwapStarted:
            return "Swapping...";
        case InputOutcome::Missed:
        case InputOutcome::Ignored:
        default:
            return {};
    }
}

// Layout works in window points (the unit of pointer events); the renderer
// scales points to output pixels on HiDPI displays.
void SyncWindowSize(SDL_Window* window, SDL_Renderer* renderer, int& width, int& height) {
    SDL_GetWindowSize(window, &width, &height);
    int output_w = 0;
    int output_h = 0;
    if (SDL_GetRendererOutputSize(renderer, &output_w, &output_h) == 0 && width > 0 &&
        height > 0) {
        SDL_RenderSetScale(renderer, static_cast<float>(output_w) / static_cast<float>(width),
                           static_cast<float>(output_h) / static_cast<float>(height));
    }
}

float ComputeUiScale(int width, int height) {
    const float scale = std::min(static_cast<float>(width) / 1280.0f,
                                 static_cast<float>(height) / 800.0f);
    return std::clamp(scale, 0.75f, 2.0f);
}

}  // namespace

int main(int /*argc*/, char* /*argv*/[]) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }
    SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);

    const int img_flags = IMG_INIT_PNG;
    const int img_result = IMG_Init(img_flags);
    if ((img_result & img_flags) != img_flags) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "IMG_Init failed: %s", IMG_GetError());
    }

    if (TTF_Init() != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TTF_Init failed: %s", TTF_GetError());
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }

    const gemgrid::core::GameConfig config = gemgrid::app::LoadGameConfig();

    Uint32 window_flags = SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI | SDL_WINDOW_RESIZABLE;
    if (config.display_mode == "fullscreen") {
        window_flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;
    }
    SDL_Window* window =
        SDL_CreateWindow("GemGrid", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                         config.resolution[0], config.resolution[1], window_flags);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        TTF_Quit();
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer =
        SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        SDL_DestroyWindow(window);
        TTF_Quit();
        if (img_result != 0) {
            IMG_Quit();
        }
        SDL_Quit();
        return 1;
    }

    int window_w = 0;
    int window_h = 0;
    SyncWindowSize(window, renderer, window_w, window_h);
    if (window_w <= 0 || window_h <= 0) {
        window_w = config.resolution[0];
        window_h = config.resolution[1];
    }

    gemgrid::render::Fonts fonts = gemgrid::render::LoadFonts(ComputeUiScale(window_w, window_h));
    if (!fonts.body) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "No font found, status panel disabled");
    }

    {
        BoardView view;
        const int icons = view.LoadIcons(renderer);
        if (icons < gemgrid::core::kTileTypeCount) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Loaded %d of %d tile icons, drawing colour swatches for the rest", icons,
                        gemgrid::core::kTileTypeCount);
        }

        std::mt19937 seed_source(config.board.seed ? *config.board.seed : std::random_device{}());
        SessionInfo session;
        session.seed = static_cast<std::uint32_t>(seed_source());
        gemgrid::core::GeneratedBoard generated =
            gemgrid::app::GenerateMatchGrid(config.board, session.seed);
        gemgrid::core::Board board = std::move(generated.board);
        session.shuffle = generated.shuffle;

        auto relayout = [&]() {
            view.SetView(gemgrid::core::ComputeView(window_w, window_h, board.cols(), board.rows(),
                                                    kPanelWidthPx, kMarginPx));
        };
        view.Materialize(board);
        relayout();

        gemgrid::core::SelectionController controller(board, view, view, config.swap.settings());

        auto regenerate = [&]() {
            if (!controller.Reset()) {
                session.status = "Wait for the swap to finish";
                return;
            }
            session.seed = static_cast<std::uint32_t>(seed_source());
            gemgrid::core::GeneratedBoard fresh =
                gemgrid::app::GenerateMatchGrid(config.board, session.seed);
            board = std::move(fresh.board);
            session.shuffle = fresh.shuffle;
            view.Materialize(board);
            session.status = "New board";
        };

        SdlInput input;
        if (!input.Initialize(window)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SdlInput initialization failed: %s",
                        SDL_GetError());
        }

        const std::vector<std::string> controls = {
            "Click or tap a tile, then a neighbour to swap",
            "R: new board",
            "Space: toggle animated swaps",
            "Esc: quit",
        };

        bool running = true;
        Uint64 last_counter = SDL_GetPerformanceCounter();
        const double frequency = static_cast<double>(SDL_GetPerformanceFrequency());

        while (running) {
            const Uint64 now = SDL_GetPerformanceCounter();
            float delta_seconds = static_cast<float>(static_cast<double>(now - last_counter) / frequency);
            last_counter = now;
            delta_seconds = std::min(delta_seconds, kMaxFrameSeconds);

            std::optional<gemgrid::core::Vec2> pick;
            for (const auto& evt : input.Poll()) {
                switch (evt.type) {
                    case InputEventType::Quit:
                        running = false;
                        break;
                    case InputEventType::MouseButtonDown:
                        if (evt.mouse_button == MouseButton::Left && !pick) {
                            pick = gemgrid::core::Vec2{evt.x, evt.y};
                        }
                        break;
                    case InputEventType::FingerUp:
                        if (!pick) {
                            pick = gemgrid::core::Vec2{evt.x, evt.y};
                        }
                        break;
                    case InputEventType::KeyDown:
                        if (evt.key == KeyCode::Escape) {
                            running = false;
                        } else if (evt.key == KeyCode::R) {
                            regenerate();
                        } else if (evt.key == KeyCode::Space) {
                            const bool animated = !controller.settings().animated;
                            if (controller.SetAnimated(animated)) {
                                session.status = animated ? "Animated swaps" : "Instant swaps";
                            }
                        }
                        break;
                    case InputEventType::WindowResized:
                        SyncWindowSize(window, renderer, window_w, window_h);
                        relayout();
                        break;
                }
            }

            if (pick) {
                const auto transition = controller.OnInput(gemgrid::core::PointerEvent{pick});
                if (transition.outcome != InputOutcome::Ignored &&
                    transition.outcome != InputOutcome::Missed) {
                    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Pick at (%.1f, %.1f): axis %s",
                                 pick->x, pick->y, gemgrid::core::SwapAxisName(transition.axis));
                    const std::string text = DescribeOutcome(transition);
                    if (!text.empty()) {
                        session.status = text;
                    }
                }
            }

            if (controller.OnTick(delta_seconds) == TickOutcome::Completed) {
                session.status = "Swap complete";
            }

            SDL_SetRenderDrawColor(renderer, 24, 26, 32, 255);
            SDL_RenderClear(renderer);
            view.Draw(renderer, board);

            if (fonts.body) {
                PanelInfo panel;
                panel.mode = controller.settings().animated ? "Animated" : "Instant";
                panel.board_size = std::to_string(board.cols()) + " x " + std::to_string(board.rows());
                panel.seed = std::to_string(session.seed);
                panel.shuffle_passes = session.shuffle.iterations;
                panel.shuffle_cap = config.board.max_shuffle_iterations;
                panel.shuffle_converged = session.shuffle.converged;
                panel.status = session.status;
                panel.controls = controls;
                gemgrid::render::DrawPanel(
                    renderer,
                    gemgrid::render::ComputePanelLayout(window_w, window_h, kPanelWidthPx, kMarginPx),
                    fonts, panel);
            }

            SDL_RenderPresent(renderer);
        }

        input.Shutdown();
    }

    gemgrid::render::DestroyFonts(fonts);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    TTF_Quit();
    if (img_result != 0) {
        IMG_Quit();
    }
    SDL_Quit();
    return 0;
}
