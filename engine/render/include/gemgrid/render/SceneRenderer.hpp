#pragma once

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <string>
#include <vector>

#include "gemgrid/core/Types.hpp"

namespace gemgrid::render {

struct Color {
    Uint8 r{255};
    Uint8 g{255};
    Uint8 b{255};
    Uint8 a{255};
};

// Fallback swatch used when a tile icon is missing.
Color TileColor(core::TileType tile);

struct Fonts {
    TTF_Font* heading = nullptr;
    TTF_Font* body = nullptr;
    TTF_Font* small = nullptr;
};

struct PanelLayout {
    float left{};
    float top{};
    float width{};
    float wrap{};
};

struct PanelInfo {
    std::string mode;
    std::string board_size;
    std::string seed;
    int shuffle_passes = 0;
    int shuffle_cap = 0;
    bool shuffle_converged = false;
    std::string status;
    std::vector<std::string> controls;
};

PanelLayout ComputePanelLayout(int window_w,
                               int window_h,
                               int panel_width_px = 360,
                               int margin_px = 40);

Fonts LoadFonts(float scale);
void DestroyFonts(Fonts& fonts);

void DrawPanel(SDL_Renderer* renderer,
               const PanelLayout& layout,
               const Fonts& fonts,
               const PanelInfo& panel);

}  // namespace gemgrid::render
