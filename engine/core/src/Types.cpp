#include "gemgrid/core/Types.hpp"

#include <array>

namespace gemgrid::core {

namespace {

constexpr std::array<std::string_view, kTileTypeCount> kTileNames{{
    "Apple",
    "Pineapple",
    "Banana",
    "Orange",
    "Strawberry",
    "Kiwi",
}};

}  // namespace

std::optional<TileType> TileTypeFromIndex(int value) noexcept {
    if (value < kMinTileType || value > kMaxTileType) {
        return std::nullopt;
    }
    return static_cast<TileType>(value);
}

std::string_view TileTypeName(TileType type) noexcept {
    const int index = TileIndex(type) - kMinTileType;
    if (index < 0 || index >= kTileTypeCount) {
        return "Invalid";
    }
    return kTileNames[static_cast<std::size_t>(index)];
}

}  // namespace gemgrid::core
