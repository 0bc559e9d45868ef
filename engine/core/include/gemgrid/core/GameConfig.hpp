#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "gemgrid/core/Board.hpp"
#include "gemgrid/core/Json.hpp"
#include "gemgrid/core/Selection.hpp"

namespace gemgrid::core {

struct BoardConfig {
    int cols = 8;
    int rows = 8;
    int tile_types = kTileTypeCount;
    int min_neighbors = kDefaultMinNeighbors;
    int max_shuffle_iterations = kDefaultShuffleIterations;
    std::optional<std::uint32_t> seed;

    Board::Rules rules() const;
};

struct SwapConfig {
    bool animated = true;
    float duration = 0.5f;
    float neighbor_distance = 1.5f;
    float self_distance = 0.5f;

    SwapSettings settings() const;
};

struct GameConfig {
    std::string display_mode = "windowed";
    std::array<int, 2> resolution{{1280, 800}};
    BoardConfig board{};
    SwapConfig swap{};

    // Throws std::invalid_argument describing the first bad value.
    void Validate() const;

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace gemgrid::core
