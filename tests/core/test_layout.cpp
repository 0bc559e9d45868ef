#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>

#include "gemgrid/core/BoardLayout.hpp"

using namespace gemgrid::core;

namespace {

bool Near(const Vec2& a, const Vec2& b) {
    return std::fabs(a.x - b.x) < 1e-3f && std::fabs(a.y - b.y) < 1e-3f;
}

void TestRestPositions() {
    assert(Near(CellRestPosition(8, 8, Cell{0, 0}), Vec2{-3.5f, -3.5f}));
    assert(Near(CellRestPosition(8, 8, Cell{7, 7}), Vec2{3.5f, 3.5f}));
    assert(Near(CellRestPosition(8, 8, Cell{4, 3}), Vec2{0.5f, -0.5f}));
    // Odd sizes halve with integer division.
    assert(Near(CellRestPosition(7, 9, Cell{0, 0}), Vec2{-2.5f, -3.5f}));
    assert(Near(CellRestPosition(7, 9, Cell{6, 8}), Vec2{3.5f, 4.5f}));
}

void TestViewRoundTrip() {
    ViewTransform view;
    view.pixels_per_unit = 80.0f;
    view.origin_x = 400.0f;
    view.origin_y = 300.0f;

    const Vec2 screen = WorldToScreen(view, Vec2{1.0f, 2.0f});
    assert(Near(screen, Vec2{480.0f, 140.0f}));
    assert(Near(ScreenToWorld(view, screen), Vec2{1.0f, 2.0f}));
}

void TestComputeViewCentersBoard() {
    const ViewTransform view = ComputeView(1280, 800, 8, 8, 360, 40);
    // Board area is 840 x 720 starting at the margin; cells are 90 px.
    assert(std::fabs(view.pixels_per_unit - 90.0f) < 1e-3f);
    assert(Near(WorldToScreen(view, Vec2{0.0f, 0.0f}), Vec2{460.0f, 400.0f}));

    // Row 0 is drawn at the bottom.
    const Vec2 bottom_left = WorldToScreen(view, CellRestPosition(8, 8, Cell{0, 0}));
    const Vec2 top_left = WorldToScreen(view, CellRestPosition(8, 8, Cell{0, 7}));
    assert(bottom_left.y > top_left.y);

    const ViewTransform odd = ComputeView(1280, 800, 7, 9, 360, 40);
    const Vec2 first = WorldToScreen(odd, CellRestPosition(7, 9, Cell{0, 0}));
    const Vec2 last = WorldToScreen(odd, CellRestPosition(7, 9, Cell{6, 8}));
    assert(Near(Vec2{0.5f * (first.x + last.x), 0.5f * (first.y + last.y)}, Vec2{460.0f, 400.0f}));
}

void TestTileContains() {
    const Vec2 center{1.5f, -0.5f};
    assert(TileContains(center, center));
    assert(TileContains(center, Vec2{1.9f, -0.1f}));
    assert(!TileContains(center, Vec2{2.1f, -0.5f}));
    assert(!TileContains(center, Vec2{1.5f, 0.2f}));
}

}  // namespace

int main() {
    TestRestPositions();
    TestViewRoundTrip();
    TestComputeViewCentersBoard();
    TestTileContains();
    std::cout << "All layout tests passed.\n";
    return 0;
}
