#include "gemgrid/core/BoardLayout.hpp"

#include <algorithm>
#include <cmath>

namespace gemgrid::core {

Vec2 CellRestPosition(int cols, int rows, const Cell& cell) {
    return Vec2{static_cast<float>(cell.col - cols / 2) + 0.5f,
                static_cast<float>(cell.row - rows / 2) + 0.5f};
}

ViewTransform ComputeView(int window_w,
                          int window_h,
                          int cols,
                          int rows,
                          int panel_width_px,
                          int margin_px) {
    const float width = static_cast<float>(window_w);
    const float height = static_cast<float>(window_h);
    const float margin = static_cast<float>(margin_px);

    const float available_width =
        std::max(0.0f, width - static_cast<float>(panel_width_px) - margin * 2.0f);
    const float available_height = std::max(0.0f, height - margin * 2.0f);
    const float cell_size = std::max(
        1.0f, std::min(available_width / static_cast<float>(cols),
                       available_height / static_cast<float>(rows)));

    // World centre of the board; not (0, 0) when a dimension is odd.
    const Vec2 first = CellRestPosition(cols, rows, Cell{0, 0});
    const Vec2 last = CellRestPosition(cols, rows, Cell{cols - 1, rows - 1});
    const float center_x = 0.5f * (first.x + last.x);
    const float center_y = 0.5f * (first.y + last.y);

    const float board_center_px = margin + 0.5f * available_width;
    const float board_center_py = margin + 0.5f * available_height;

    ViewTransform view;
    view.pixels_per_unit = cell_size;
    view.origin_x = board_center_px - center_x * cell_size;
    view.origin_y = board_center_py + center_y * cell_size;
    return view;
}

Vec2 WorldToScreen(const ViewTransform& view, const Vec2& world) {
    return Vec2{view.origin_x + world.x * view.pixels_per_unit,
                view.origin_y - world.y * view.pixels_per_unit};
}

Vec2 ScreenToWorld(const ViewTransform& view, const Vec2& screen) {
    return Vec2{(screen.x - view.origin_x) / view.pixels_per_unit,
                (view.origin_y - screen.y) / view.pixels_per_unit};
}

bool TileContains(const Vec2& tile_center, const Vec2& world_point) {
    return std::fabs(world_point.x - tile_center.x) <= kTileHalfExtent &&
           std::fabs(world_point.y - tile_center.y) <= kTileHalfExtent;
}

}  // namespace gemgrid::core
