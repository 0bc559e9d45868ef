#include "gemgrid/render/BoardView.hpp"

#include <SDL2/SDL_image.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "gemgrid/app/AssetFS.hpp"
#include "gemgrid/render/SceneRenderer.hpp"

namespace gemgrid::render {

namespace {

constexpr float kCellInset = 0.04f;
constexpr float kHighlightScale = 1.1f;

std::string IconFilename(core::TileType tile) {
    std::string name(core::TileTypeName(tile));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "gems/" + name + ".png";
}

SDL_FRect MakeRect(float center_x, float center_y, float half) {
    return SDL_FRect{center_x - half, center_y - half, half * 2.0f, half * 2.0f};
}

}  // namespace

BoardView::~BoardView() {
    DestroyIcons();
}

int BoardView::LoadIcons(SDL_Renderer* renderer) {
    DestroyIcons();
    int loaded = 0;
    for (int value = core::kMinTileType; value <= core::kMaxTileType; ++value) {
        const auto tile = static_cast<core::TileType>(value);
        const auto path = gemgrid::app::AssetPath(IconFilename(tile));
        SDL_Surface* surface = IMG_Load(path.string().c_str());
        if (!surface) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load icon %s: %s",
                        path.string().c_str(), IMG_GetError());
            continue;
        }
        SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
        SDL_FreeSurface(surface);
        if (!texture) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to create icon texture: %s",
                        SDL_GetError());
            continue;
        }
        icons_[static_cast<std::size_t>(value - core::kMinTileType)] = texture;
        ++loaded;
    }
    return loaded;
}

void BoardView::DestroyIcons() {
    for (auto& texture : icons_) {
        if (texture) {
            SDL_DestroyTexture(texture);
            texture = nullptr;
        }
    }
}

void BoardView::Materialize(const core::Board& board) {
    sprites_.clear();
    cols_ = board.cols();
    rows_ = board.rows();
    sprites_.reserve(static_cast<std::size_t>(cols_) * static_cast<std::size_t>(rows_));
    for (int col = 0; col < cols_; ++col) {
        for (int row = 0; row < rows_; ++row) {
            TileSprite entry;
            entry.position = core::CellRestPosition(cols_, rows_, core::Cell{col, row});
            sprites_.push_back(entry);
        }
    }
}

BoardView::TileSprite* BoardView::sprite(const core::Cell& cell) {
    if (cell.col < 0 || cell.col >= cols_ || cell.row < 0 || cell.row >= rows_) {
        return nullptr;
    }
    return &sprites_[static_cast<std::size_t>(cell.col * rows_ + cell.row)];
}

std::optional<core::TileHit> BoardView::Resolve(const core::Vec2& screen_point) const {
    const core::Vec2 world = core::ScreenToWorld(view_, screen_point);
    for (int col = 0; col < cols_; ++col) {
        for (int row = 0; row < rows_; ++row) {
            const TileSprite& entry = sprites_[static_cast<std::size_t>(col * rows_ + row)];
            if (core::TileContains(entry.position, world)) {
                return core::TileHit{core::Cell{col, row}, entry.position};
            }
        }
    }
    return std::nullopt;
}

void BoardView::SetHighlighted(const core::Cell& cell, bool highlighted) {
    if (auto* entry = sprite(cell)) {
        entry->highlighted = highlighted;
    }
}

void BoardView::SetTilePosition(const core::Cell& cell, const core::Vec2& position) {
    if (auto* entry = sprite(cell)) {
        entry->position = position;
    }
}

void BoardView::SwapTiles(const core::Cell& a, const core::Cell& b) {
    auto* first = sprite(a);
    auto* second = sprite(b);
    if (first && second) {
        std::swap(*first, *second);
    }
}

void BoardView::Draw(SDL_Renderer* renderer, const core::Board& board) const {
    if (board.cols() != cols_ || board.rows() != rows_) {
        return;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    const float base_half = 0.5f * view_.pixels_per_unit * (1.0f - 2.0f * kCellInset);

    auto draw_tile = [&](int col, int row, const TileSprite& entry) {
        const core::TileType tile = board.get(col, row);
        const core::Vec2 center = core::WorldToScreen(view_, entry.position);
        const float half = entry.highlighted ? base_half * kHighlightScale : base_half;
        const SDL_FRect rect = MakeRect(center.x, center.y, half);

        SDL_Texture* icon = icons_[static_cast<std::size_t>(core::TileIndex(tile) - core::kMinTileType)];
        if (icon) {
            SDL_RenderCopyF(renderer, icon, nullptr, &rect);
        } else {
            const Color color = TileColor(tile);
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
            SDL_RenderFillRectF(renderer, &rect);
        }

        if (entry.highlighted) {
            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 220);
            SDL_RenderDrawRectF(renderer, &rect);
        }
    };

    // Highlighted tiles last so their enlarged outline is not covered.
    for (int pass = 0; pass < 2; ++pass) {
        const bool want_highlighted = pass == 1;
        for (int col = 0; col < cols_; ++col) {
            for (int row = 0; row < rows_; ++row) {
                const TileSprite& entry = sprites_[static_cast<std::size_t>(col * rows_ + row)];
                if (entry.highlighted == want_highlighted) {
                    draw_tile(col, row, entry);
                }
            }
        }
    }
}

}  // namespace gemgrid::render
