#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace gemgrid::core {

struct Cell {
    std::int32_t col{};
    std::int32_t row{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return col == other.col && row == other.row;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Cell& other) const noexcept {
        return col < other.col || (col == other.col && row < other.row);
    }
};

// Values start at 1 so a zeroed cell never reads as a real tile.
enum class TileType : std::uint8_t {
    Apple = 1,
    Pineapple,
    Banana,
    Orange,
    Strawberry,
    Kiwi
};

inline constexpr int kMinTileType = static_cast<int>(TileType::Apple);
inline constexpr int kMaxTileType = static_cast<int>(TileType::Kiwi);
inline constexpr int kTileTypeCount = kMaxTileType - kMinTileType + 1;

constexpr int TileIndex(TileType type) noexcept {
    return static_cast<int>(type);
}

std::optional<TileType> TileTypeFromIndex(int value) noexcept;
std::string_view TileTypeName(TileType type) noexcept;

struct Vec2 {
    float x{};
    float y{};

    constexpr bool operator==(const Vec2& other) const noexcept {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const noexcept {
        return !(*this == other);
    }
};

// Unclamped: t outside [0, 1] extrapolates along the segment.
constexpr Vec2 Lerp(const Vec2& a, const Vec2& b, float t) noexcept {
    return Vec2{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

}  // namespace gemgrid::core
