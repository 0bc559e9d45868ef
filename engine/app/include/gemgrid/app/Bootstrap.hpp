#pragma once

#include <cstdint>
#include <string>

#include "gemgrid/core/Board.hpp"
#include "gemgrid/core/GameConfig.hpp"

namespace gemgrid::app {

inline constexpr const char* kConfigFilename = "gemgrid.json";

// Reads and validates gemgrid.json from the asset roots. Any problem is logged
// and the defaults are returned instead.
core::GameConfig LoadGameConfig();

// Solved grid, then shuffle, logging both grids and the pass count.
core::GeneratedBoard GenerateMatchGrid(const core::BoardConfig& config, std::uint32_t seed);

void LogGrid(const std::string& title, const core::Board& board);

}  // namespace gemgrid::app
