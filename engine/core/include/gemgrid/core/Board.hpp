#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "gemgrid/core/Types.hpp"

namespace gemgrid::core {

// Same-type neighbours (per axis, within +-kDefaultMinNeighbors) that make a
// local match. Generation lays runs of kDefaultMinNeighbors + 1 tiles.
inline constexpr int kDefaultMinNeighbors = 2;
inline constexpr int kDefaultShuffleIterations = 200;

// Largest accepted board side; keeps cols * rows well inside int.
inline constexpr int kMaxBoardSide = 1024;

// Random re-draws allowed per matching cell before Shuffle falls back to a
// deterministic scan for a partner of a different type.
inline constexpr int kMaxRandomPickAttempts = 64;

class Board {
public:
    struct Rules {
        int cols = 8;
        int rows = 8;
        int tile_types = kTileTypeCount;
        int min_neighbors = kDefaultMinNeighbors;

        int runLength() const noexcept { return min_neighbors + 1; }
    };

    // Cells are column-major: index = col * rows + row.
    Board(const Rules& rules, std::vector<TileType> cells,
          std::uint32_t seed = std::random_device{}());
    Board(const Rules& rules, TileType fill, std::uint32_t seed = std::random_device{}());

    int cols() const noexcept { return rules_.cols; }
    int rows() const noexcept { return rules_.rows; }
    int tileTypes() const noexcept { return rules_.tile_types; }
    int minNeighbors() const noexcept { return rules_.min_neighbors; }
    const Rules& rules() const noexcept { return rules_; }

    bool inBounds(int col, int row) const noexcept;
    bool inBounds(const Cell& cell) const noexcept { return inBounds(cell.col, cell.row); }

    TileType get(int col, int row) const noexcept;
    TileType get(const Cell& cell) const noexcept { return get(cell.col, cell.row); }

    void set(int col, int row, TileType value) noexcept;
    void set(const Cell& cell, TileType value) noexcept { set(cell.col, cell.row, value); }

    void swapCells(const Cell& a, const Cell& b) noexcept;

    TileType randomTile();

    std::mt19937& rng() noexcept { return rng_; }
    const std::mt19937& rng() const noexcept { return rng_; }

    const std::vector<TileType>& cells() const noexcept { return cells_; }

private:
    int index(int col, int row) const noexcept;

    Rules rules_{};
    std::vector<TileType> cells_;
    std::mt19937 rng_{};
};

// Throws std::invalid_argument when the rules cannot produce a board.
void ValidateRules(const Board::Rules& rules);

// Fills the grid with straight runs so that every cell is part of a match.
// The result is the starting point for Shuffle.
Board GenerateSolvedGrid(const Board::Rules& rules,
                         std::uint32_t seed = std::random_device{}());

bool HasLocalMatch(const Board& board, int col, int row);
bool HasLocalMatch(const Board& board, const Cell& cell);
bool HasAnyLocalMatch(const Board& board);

struct ShuffleStats {
    int iterations = 0;
    int swaps = 0;
    int fallback_picks = 0;
    bool converged = false;
};

// Best effort: may stop at max_iterations with local matches left on the board.
ShuffleStats Shuffle(Board& board, int max_iterations = kDefaultShuffleIterations);

struct GeneratedBoard {
    Board board;
    ShuffleStats shuffle{};
};

// Called with the solved grid before it is shuffled.
using SolvedGridHook = std::function<void(const Board&)>;

GeneratedBoard NewBoard(const Board::Rules& rules,
                        int max_iterations = kDefaultShuffleIterations,
                        std::uint32_t seed = std::random_device{}(),
                        const SolvedGridHook& on_solved = {});

// Count per tile type; slot 0 is Apple.
using TileHistogram = std::array<int, kTileTypeCount>;
TileHistogram CountTiles(const Board& board);

// One line per row, one letter per tile (first letter of its name).
std::string DescribeGrid(const Board& board);

}  // namespace gemgrid::core
