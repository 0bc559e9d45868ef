#pragma once

#include "gemgrid/core/Types.hpp"

namespace gemgrid::core {

// Tiles are one world unit wide; their colliders span +-kTileHalfExtent.
inline constexpr float kTileHalfExtent = 0.5f;

// Maps world units (Y up) to screen pixels (Y down).
struct ViewTransform {
    float pixels_per_unit = 64.0f;
    float origin_x = 0.0f;  // screen position of world (0, 0)
    float origin_y = 0.0f;
};

// Resting world position of a tile: (col - cols / 2 + 0.5, row - rows / 2 + 0.5).
Vec2 CellRestPosition(int cols, int rows, const Cell& cell);

ViewTransform ComputeView(int window_w,
                          int window_h,
                          int cols,
                          int rows,
                          int panel_width_px = 360,
                          int margin_px = 40);

Vec2 WorldToScreen(const ViewTransform& view, const Vec2& world);
Vec2 ScreenToWorld(const ViewTransform& view, const Vec2& screen);

bool TileContains(const Vec2& tile_center, const Vec2& world_point);

}  // namespace gemgrid::core
