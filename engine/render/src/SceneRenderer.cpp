#include "gemgrid/render/SceneRenderer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>

#include "gemgrid/app/AssetFS.hpp"

namespace gemgrid::render {

namespace {

TTF_Font* LoadFontFromCandidates(const std::vector<std::filesystem::path>& candidates,
                                 int point_size) {
    for (const auto& candidate : candidates) {
        if (!gemgrid::app::FileExists(candidate)) {
            continue;
        }
        TTF_Font* font = TTF_OpenFont(candidate.string().c_str(), point_size);
        if (font) {
            TTF_SetFontHinting(font, TTF_HINTING_LIGHT);
            return font;
        }
    }
    return nullptr;
}

const std::array<Color, core::kTileTypeCount> kTileColors{{
    Color{214, 48, 49, 255},
    Color{253, 203, 110, 255},
    Color{255, 234, 167, 255},
    Color{225, 112, 85, 255},
    Color{232, 67, 147, 255},
    Color{85, 239, 196, 255},
}};

int RenderTextLine(SDL_Renderer* renderer,
                   TTF_Font* font,
                   int x,
                   int y,
                   const std::string& text,
                   SDL_Color color) {
    if (!font || text.empty()) {
        return 0;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return 0;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        int h = surface->h;
        SDL_FreeSurface(surface);
        return h;
    }
    SDL_Rect dst{x, y, surface->w, surface->h};
    SDL_RenderCopy(renderer, texture, nullptr, &dst);
    int height = surface->h;
    SDL_DestroyTexture(texture);
    SDL_FreeSurface(surface);
    return height;
}

int RenderWrappedText(SDL_Renderer* renderer,
                      TTF_Font* font,
                      int x,
                      int y,
                      const std::string& text,
                      SDL_Color color,
                      int wrap_width) {
    if (!font || text.empty()) {
        return 0;
    }
    SDL_Surface* surface =
        TTF_RenderUTF8_Blended_Wrapped(font, text.c_str(), color, static_cast<Uint32>(wrap_width));
    if (!surface) {
        return 0;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (!texture) {
        int h = surface->h;
        SDL_FreeSurface(surface);
        return h;
    }
    SDL_Rect dst{x, y, surface->w, surface->h};
    SDL_RenderCopy(renderer, texture, nullptr, &dst);
    int height = surface->h;
    SDL_DestroyTexture(texture);
    SDL_FreeSurface(surface);
    return height;
}

int ScaledFontSize(int base_size, float scale) {
    int scaled = static_cast<int>(std::lround(static_cast<double>(base_size) * scale));
    if (scaled <= 0) {
        scaled = base_size;
    }
    return std::max(12, scaled);
}

}  // namespace

Color TileColor(core::TileType tile) {
    const int index = core::TileIndex(tile) - core::kMinTileType;
    if (index < 0 || index >= static_cast<int>(kTileColors.size())) {
        return Color{64, 64, 64, 255};
    }
    return kTileColors[static_cast<std::size_t>(index)];
}

PanelLayout ComputePanelLayout(int window_w, int window_h, int panel_width_px, int margin_px) {
    (void)window_h;
    const float width = static_cast<float>(window_w);
    const float margin = static_cast<float>(margin_px);
    PanelLayout layout;
    layout.width = static_cast<float>(panel_width_px);
    layout.left = std::max(margin, width - layout.width - margin);
    layout.top = margin;
    layout.wrap = layout.width - std::max(24.0f, layout.width * 0.08f);
    return layout;
}

Fonts LoadFonts(float scale) {
    std::vector<std::filesystem::path> search_paths = {
        gemgrid::app::AssetPath("fonts/SourceCodePro-Regular.ttf"),
        gemgrid::app::AssetPath("fonts/RobotoMono-Regular.ttf"),
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "C:/Windows/Fonts/consola.ttf",
        "C:/Windows/Fonts/segoeui.ttf",
    };

    Fonts fonts;
    fonts.heading = LoadFontFromCandidates(search_paths, ScaledFontSize(26, scale));
    fonts.body = LoadFontFromCandidates(search_paths, ScaledFontSize(20, scale));
    fonts.small = LoadFontFromCandidates(search_paths, ScaledFontSize(16, scale));
    return fonts;
}

void DestroyFonts(Fonts& fonts) {
    if (fonts.heading) {
        TTF_CloseFont(fonts.heading);
        fonts.heading = nullptr;
    }
    if (fonts.body) {
        TTF_CloseFont(fonts.body);
        fonts.body = nullptr;
    }
    if (fonts.small) {
        TTF_CloseFont(fonts.small);
        fonts.small = nullptr;
    }
}

void DrawPanel(SDL_Renderer* renderer,
               const PanelLayout& layout,
               const Fonts& fonts,
               const PanelInfo& panel) {
    const SDL_Color heading_color{210, 215, 225, 255};
    const SDL_Color value_color{235, 240, 245, 255};
    const SDL_Color detail_color{170, 180, 190, 255};
    const SDL_Color warn_color{255, 196, 92, 255};

    TTF_Font* heading_font = fonts.heading ? fonts.heading : fonts.body;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.small;
    TTF_Font* small_font =
        fonts.small ? fonts.small : (fonts.body ? fonts.body : fonts.heading);

    int x = static_cast<int>(layout.left);
    int y = static_cast<int>(layout.top);
    const int wrap_width = std::max(40, static_cast<int>(layout.wrap));

    auto add_line = [&](TTF_Font* font, const std::string& text, SDL_Color color, int spacing) {
        if (!font || text.empty()) {
            return;
        }
        int height = RenderTextLine(renderer, font, x, y, text, color);
        y += height + spacing;
    };

    auto label_value = [&](const std::string& label, const std::string& value) {
        add_line(body_font, label + " " + value, value_color, 10);
    };

    add_line(heading_font, "Board:", heading_color, 6);
    label_value("SIZE:", panel.board_size);
    label_value("SEED:", panel.seed);
    label_value("SWAPS:", panel.mode);
    y += 12;

    add_line(heading_font, "Shuffle:", heading_color, 6);
    label_value("PASSES:",
                std::to_string(panel.shuffle_passes) + " / " + std::to_string(panel.shuffle_cap));
    add_line(body_font,
             panel.shuffle_converged ? "No local matches" : "Stopped with local matches",
             panel.shuffle_converged ? value_color : warn_color,
             10);
    y += 12;

    add_line(heading_font, "Status:", heading_color, 6);
    const std::string status_text = panel.status.empty() ? "Select a tile" : panel.status;
    if (body_font) {
        int height = RenderWrappedText(renderer, body_font, x, y, status_text, value_color, wrap_width);
        y += height + 16;
    }

    add_line(heading_font, "Controls:", heading_color, 6);
    for (const auto& line : panel.controls) {
        if (!small_font) {
            break;
        }
        int height = RenderWrappedText(renderer, small_font, x, y, line, detail_color, wrap_width);
        y += height + 6;
    }
}

}  // namespace gemgrid::render
