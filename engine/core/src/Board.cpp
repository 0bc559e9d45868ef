#include "gemgrid/core/Board.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace gemgrid::core {

namespace {

TileType DrawTile(std::mt19937& rng, int tile_types) {
    std::uniform_int_distribution<int> dist(kMinTileType, kMinTileType + tile_types - 1);
    return static_cast<TileType>(dist(rng));
}

std::optional<Cell> PickDifferentCell(Board& board, const Cell& origin, ShuffleStats& stats) {
    const TileType tile = board.get(origin);
    std::uniform_int_distribution<int> col_dist(0, board.cols() - 1);
    std::uniform_int_distribution<int> row_dist(0, board.rows() - 1);
    for (int attempt = 0; attempt < kMaxRandomPickAttempts; ++attempt) {
        Cell candidate{col_dist(board.rng()), row_dist(board.rng())};
        if (board.get(candidate) != tile) {
            return candidate;
        }
    }

    ++stats.fallback_picks;
    for (int col = 0; col < board.cols(); ++col) {
        for (int row = 0; row < board.rows(); ++row) {
            if (board.get(col, row) != tile) {
                return Cell{col, row};
            }
        }
    }
    return std::nullopt;
}

std::vector<TileType> FilledCells(const Board::Rules& rules, TileType fill) {
    ValidateRules(rules);
    return std::vector<TileType>(
        static_cast<std::size_t>(rules.cols) * static_cast<std::size_t>(rules.rows), fill);
}

}  // namespace

void ValidateRules(const Board::Rules& rules) {
    if (rules.min_neighbors < 1) {
        throw std::invalid_argument("min_neighbors must be at least 1");
    }
    if (rules.cols > kMaxBoardSide || rules.rows > kMaxBoardSide) {
        throw std::invalid_argument("board sides must not exceed " +
                                    std::to_string(kMaxBoardSide));
    }
    if (rules.min_neighbors >= rules.cols || rules.min_neighbors >= rules.rows) {
        throw std::invalid_argument("board of " + std::to_string(rules.cols) + "x" +
                                    std::to_string(rules.rows) +
                                    " cannot hold a run of " +
                                    std::to_string(static_cast<long long>(rules.min_neighbors) + 1) +
                                    " tiles");
    }
    if (rules.tile_types < 1 || rules.tile_types > kTileTypeCount) {
        throw std::invalid_argument("tile_types must be between 1 and " +
                                    std::to_string(kTileTypeCount));
    }
}

Board::Board(const Rules& rules, std::vector<TileType> cells, std::uint32_t seed)
    : rules_(rules), cells_(std::move(cells)), rng_(seed) {
    ValidateRules(rules_);
    if (cells_.size() != static_cast<std::size_t>(rules_.cols) * static_cast<std::size_t>(rules_.rows)) {
        throw std::invalid_argument("cell count does not match board dimensions");
    }
}

Board::Board(const Rules& rules, TileType fill, std::uint32_t seed)
    : Board(rules, FilledCells(rules, fill), seed) {}

bool Board::inBounds(int col, int row) const noexcept {
    return col >= 0 && col < rules_.cols && row >= 0 && row < rules_.rows;
}

TileType Board::get(int col, int row) const noexcept {
    return cells_[index(col, row)];
}

void Board::set(int col, int row, TileType value) noexcept {
    cells_[index(col, row)] = value;
}

void Board::swapCells(const Cell& a, const Cell& b) noexcept {
    std::swap(cells_[index(a.col, a.row)], cells_[index(b.col, b.row)]);
}

TileType Board::randomTile() {
    return DrawTile(rng_, rules_.tile_types);
}

int Board::index(int col, int row) const noexcept {
    return col * rules_.rows + row;
}

Board GenerateSolvedGrid(const Board::Rules& rules, std::uint32_t seed) {
    ValidateRules(rules);

    const int cols = rules.cols;
    const int rows = rules.rows;
    const int reach = rules.min_neighbors;
    std::mt19937 rng(seed);

    std::vector<std::optional<TileType>> pending(
        static_cast<std::size_t>(cols) * static_cast<std::size_t>(rows));
    auto slot = [&](int col, int row) -> std::optional<TileType>& {
        return pending[static_cast<std::size_t>(col * rows + row)];
    };

    for (int col = 0; col < cols; ++col) {
        for (int row = 0; row < rows; ++row) {
            if (slot(col, row)) {
                continue;
            }
            if (col + reach < cols) {
                const TileType tile = DrawTile(rng, rules.tile_types);
                for (int i = 0; i <= reach; ++i) {
                    slot(col + i, row) = tile;
                }
            } else if (row + reach < rows) {
                const TileType tile = DrawTile(rng, rules.tile_types);
                for (int i = 0; i <= reach; ++i) {
                    slot(col, row + i) = tile;
                }
            } else if (col - reach >= 0) {
                // Nothing fits right or down: extend the run on the left.
                slot(col, row) = slot(col - 1, row);
            } else {
                throw std::logic_error("no run fits at (" + std::to_string(col) + ", " +
                                       std::to_string(row) + ") while generating grid");
            }
        }
    }

    std::vector<TileType> cells;
    cells.reserve(pending.size());
    for (const auto& tile : pending) {
        if (!tile) {
            throw std::logic_error("generated grid left a cell unassigned");
        }
        cells.push_back(*tile);
    }

    Board board(rules, std::move(cells), seed);
    board.rng() = rng;
    return board;
}

bool HasLocalMatch(const Board& board, int col, int row) {
    if (!board.inBounds(col, row)) {
        return false;
    }
    const TileType tile = board.get(col, row);
    const int reach = board.minNeighbors();

    int count = 0;
    for (int i = -reach; i <= reach; ++i) {
        if (i != 0 && board.inBounds(col + i, row) && board.get(col + i, row) == tile) {
            ++count;
        }
    }
    if (count >= reach) {
        return true;
    }

    count = 0;
    for (int i = -reach; i <= reach; ++i) {
        if (i != 0 && board.inBounds(col, row + i) && board.get(col, row + i) == tile) {
            ++count;
        }
    }
    return count >= reach;
}

bool HasLocalMatch(const Board& board, const Cell& cell) {
    return HasLocalMatch(board, cell.col, cell.row);
}

bool HasAnyLocalMatch(const Board& board) {
    for (int col = 0; col < board.cols(); ++col) {
        for (int row = 0; row < board.rows(); ++row) {
            if (HasLocalMatch(board, col, row)) {
                return true;
            }
        }
    }
    return false;
}

ShuffleStats Shuffle(Board& board, int max_iterations) {
    if (max_iterations < 0) {
        throw std::invalid_argument("max_iterations must not be negative");
    }

    ShuffleStats stats;
    while (stats.iterations < max_iterations && HasAnyLocalMatch(board)) {
        for (int col = 0; col < board.cols(); ++col) {
            for (int row = 0; row < board.rows(); ++row) {
                const Cell cell{col, row};
                if (!HasLocalMatch(board, cell)) {
                    continue;
                }
                if (auto partner = PickDifferentCell(board, cell, stats)) {
                    board.swapCells(cell, *partner);
                    ++stats.swaps;
                }
            }
        }
        ++stats.iterations;
    }
    stats.converged = !HasAnyLocalMatch(board);
    return stats;
}

GeneratedBoard NewBoard(const Board::Rules& rules, int max_iterations, std::uint32_t seed,
                        const SolvedGridHook& on_solved) {
    GeneratedBoard result{GenerateSolvedGrid(rules, seed)};
    if (on_solved) {
        on_solved(result.board);
    }
    result.shuffle = Shuffle(result.board, max_iterations);
    return result;
}

TileHistogram CountTiles(const Board& board) {
    TileHistogram histogram{};
    for (TileType tile : board.cells()) {
        ++histogram[static_cast<std::size_t>(TileIndex(tile) - kMinTileType)];
    }
    return histogram;
}

std::string DescribeGrid(const Board& board) {
    std::string out;
    out.reserve(static_cast<std::size_t>(board.rows()) *
                static_cast<std::size_t>(board.cols() * 2 + 1));
    for (int row = 0; row < board.rows(); ++row) {
        for (int col = 0; col < board.cols(); ++col) {
            if (col > 0) {
                out.push_back(' ');
            }
            out.push_back(TileTypeName(board.get(col, row)).front());
        }
        out.push_back('\n');
    }
    return out;
}

}  // namespace gemgrid::core
