#pragma once

#include <SDL2/SDL.h>

#include <array>
#include <optional>
#include <vector>

#include "gemgrid/core/Board.hpp"
#include "gemgrid/core/BoardLayout.hpp"
#include "gemgrid/core/Selection.hpp"

namespace gemgrid::render {

// One sprite per board cell. Sprites keep their own world position so that a
// tile moved by a swap is drawn and picked where it currently is.
class BoardView : public core::TileHitResolver, public core::TileVisualSink {
public:
    BoardView() = default;
    ~BoardView() override;

    BoardView(const BoardView&) = delete;
    BoardView& operator=(const BoardView&) = delete;

    // Returns the number of icons loaded; missing icons fall back to colour swatches.
    int LoadIcons(SDL_Renderer* renderer);
    void DestroyIcons();

    // Drops every existing sprite and creates one per cell at its resting position.
    void Materialize(const core::Board& board);

    void SetView(const core::ViewTransform& view) { view_ = view; }
    const core::ViewTransform& view() const noexcept { return view_; }

    std::optional<core::TileHit> Resolve(const core::Vec2& screen_point) const override;

    void SetHighlighted(const core::Cell& cell, bool highlighted) override;
    void SetTilePosition(const core::Cell& cell, const core::Vec2& position) override;
    void SwapTiles(const core::Cell& a, const core::Cell& b) override;

    void Draw(SDL_Renderer* renderer, const core::Board& board) const;

private:
    struct TileSprite {
        core::Vec2 position{};
        bool highlighted = false;
    };

    TileSprite* sprite(const core::Cell& cell);

    int cols_ = 0;
    int rows_ = 0;
    std::vector<TileSprite> sprites_;
    std::array<SDL_Texture*, core::kTileTypeCount> icons_{};
    core::ViewTransform view_{};
};

}  // namespace gemgrid::render
