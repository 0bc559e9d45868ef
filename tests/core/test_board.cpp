#undef NDEBUG
#include <cassert>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "gemgrid/core/Board.hpp"

using namespace gemgrid::core;

namespace {

Board::Rules MakeRules(int cols, int rows, int tile_types = kTileTypeCount) {
    Board::Rules rules;
    rules.cols = cols;
    rules.rows = rows;
    rules.tile_types = tile_types;
    return rules;
}

// (col + 2 * row) % 5 keeps every +-2 window free of repeats on both axes.
Board MakePatternBoard(int cols, int rows) {
    Board board(MakeRules(cols, rows), TileType::Apple, /*seed=*/7);
    for (int c = 0; c < cols; ++c) {
        for (int r = 0; r < rows; ++r) {
            board.set(c, r, static_cast<TileType>((c + 2 * r) % 5 + kMinTileType));
        }
    }
    return board;
}

void AssertTilesInRange(const Board& board) {
    for (TileType tile : board.cells()) {
        const int value = TileIndex(tile);
        assert(value >= kMinTileType);
        assert(value < kMinTileType + board.tileTypes());
    }
}

void TestSolvedGridFillsEveryCell() {
    const int sizes[][2] = {{3, 3}, {3, 8}, {8, 3}, {4, 5}, {7, 9}, {8, 8}, {12, 10}};
    for (const auto& size : sizes) {
        for (std::uint32_t seed = 1; seed <= 5; ++seed) {
            auto board = GenerateSolvedGrid(MakeRules(size[0], size[1]), seed);
            assert(board.cols() == size[0]);
            assert(board.rows() == size[1]);
            assert(board.cells().size() == static_cast<std::size_t>(size[0] * size[1]));
            AssertTilesInRange(board);

            const auto histogram = CountTiles(board);
            assert(std::accumulate(histogram.begin(), histogram.end(), 0) == size[0] * size[1]);
        }
    }
}

void TestSolvedGridMatchesEverywhere() {
    const int sizes[][2] = {{3, 3}, {4, 5}, {7, 9}, {8, 8}};
    for (const auto& size : sizes) {
        auto board = GenerateSolvedGrid(MakeRules(size[0], size[1]), /*seed=*/42);
        for (int c = 0; c < board.cols(); ++c) {
            for (int r = 0; r < board.rows(); ++r) {
                assert(HasLocalMatch(board, c, r));
            }
        }
        assert(HasAnyLocalMatch(board));
    }
}

void TestSolvedGridLaysRunsRightward() {
    auto board = GenerateSolvedGrid(MakeRules(8, 8), /*seed=*/3);
    for (int r = 0; r < board.rows(); ++r) {
        assert(board.get(0, r) == board.get(1, r));
        assert(board.get(1, r) == board.get(2, r));
        assert(board.get(3, r) == board.get(4, r));
        assert(board.get(4, r) == board.get(5, r));
    }
    // Columns 6 and 7 cannot fit a rightward run: downward runs, then copies
    // from the left on the last two rows.
    for (int c = 6; c < 8; ++c) {
        assert(board.get(c, 0) == board.get(c, 1) && board.get(c, 1) == board.get(c, 2));
        assert(board.get(c, 3) == board.get(c, 4) && board.get(c, 4) == board.get(c, 5));
        assert(board.get(c, 6) == board.get(5, 6));
        assert(board.get(c, 7) == board.get(5, 7));
    }
}

void TestRejectsUnusableRules() {
    const Board::Rules bad_rules[] = {
        MakeRules(2, 8),
        MakeRules(8, 2),
        MakeRules(8, 8, 0),
        MakeRules(8, 8, kTileTypeCount + 1),
    };
    for (const auto& rules : bad_rules) {
        bool threw = false;
        try {
            GenerateSolvedGrid(rules, 1);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    Board::Rules long_runs = MakeRules(3, 8);
    long_runs.min_neighbors = 3;
    bool threw = false;
    try {
        Board board(long_runs, TileType::Apple);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Board board(MakeRules(3, 3), std::vector<TileType>(8, TileType::Kiwi));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void TestPatternBoardHasNoMatches() {
    auto board = MakePatternBoard(8, 8);
    assert(!HasAnyLocalMatch(board));
}

void TestMatchWindowCountsGaps() {
    auto board = MakePatternBoard(5, 5);
    // K . K . K along row 0: the centre sees two Kiwis at +-2.
    board.set(0, 0, TileType::Kiwi);
    board.set(2, 0, TileType::Kiwi);
    board.set(4, 0, TileType::Kiwi);
    assert(HasLocalMatch(board, 2, 0));
    assert(!HasLocalMatch(board, 0, 0));
    assert(!HasLocalMatch(board, 4, 0));
    assert(HasAnyLocalMatch(board));
}

void TestMatchAxesAreIndependent() {
    auto board = MakePatternBoard(5, 5);
    board.set(1, 1, TileType::Kiwi);
    board.set(1, 2, TileType::Kiwi);
    board.set(1, 3, TileType::Kiwi);
    assert(HasLocalMatch(board, 1, 2));
    assert(HasLocalMatch(board, Cell{1, 1}));
    assert(!HasLocalMatch(board, 0, 2));
    assert(!HasLocalMatch(board, 2, 2));
    assert(!HasLocalMatch(board, -1, 0));
}

void TestShuffleRespectsCapAndPreservesTiles() {
    for (std::uint32_t seed = 1; seed <= 25; ++seed) {
        auto board = GenerateSolvedGrid(MakeRules(8, 8), seed);
        const auto before = CountTiles(board);

        const auto stats = Shuffle(board, kDefaultShuffleIterations);
        assert(stats.iterations >= 1);
        assert(stats.iterations <= kDefaultShuffleIterations);
        assert(!HasAnyLocalMatch(board) || stats.iterations == kDefaultShuffleIterations);
        assert(stats.converged == !HasAnyLocalMatch(board));
        assert(CountTiles(board) == before);
        AssertTilesInRange(board);
    }
}

void TestShuffleStopsAtSmallCap() {
    auto board = GenerateSolvedGrid(MakeRules(8, 8), /*seed=*/11);
    const auto before = CountTiles(board);
    const auto stats = Shuffle(board, 1);
    assert(stats.iterations == 1);
    assert(stats.swaps > 0);
    assert(CountTiles(board) == before);

    bool threw = false;
    try {
        Shuffle(board, -1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void TestShuffleLeavesCleanBoardAlone() {
    auto board = MakePatternBoard(6, 6);
    const auto cells = board.cells();
    const auto stats = Shuffle(board);
    assert(stats.iterations == 0);
    assert(stats.swaps == 0);
    assert(stats.converged);
    assert(board.cells() == cells);
}

void TestShuffleSurvivesSingleTileType() {
    auto board = GenerateSolvedGrid(MakeRules(4, 4, 1), /*seed=*/5);
    for (TileType tile : board.cells()) {
        assert(tile == TileType::Apple);
    }
    const auto stats = Shuffle(board, 5);
    assert(stats.iterations == 5);
    assert(stats.swaps == 0);
    assert(stats.fallback_picks == 16 * 5);
    assert(!stats.converged);
    assert(HasAnyLocalMatch(board));
}

void TestShuffleWithTwoTileTypes() {
    auto board = GenerateSolvedGrid(MakeRules(6, 6, 2), /*seed=*/9);
    const auto before = CountTiles(board);
    const auto stats = Shuffle(board, 50);
    assert(stats.iterations <= 50);
    assert(!HasAnyLocalMatch(board) || stats.iterations == 50);
    assert(CountTiles(board) == before);
    AssertTilesInRange(board);
}

void TestNewBoardIsDeterministicForSeed() {
    const auto rules = MakeRules(8, 8);
    auto first = NewBoard(rules, kDefaultShuffleIterations, /*seed=*/2024);
    auto second = NewBoard(rules, kDefaultShuffleIterations, /*seed=*/2024);
    assert(first.board.cells() == second.board.cells());
    assert(first.shuffle.iterations == second.shuffle.iterations);
    assert(first.shuffle.swaps == second.shuffle.swaps);
}

void TestNewBoardReportsSolvedGrid() {
    const auto rules = MakeRules(6, 5);
    std::vector<TileType> solved_cells;
    auto generated = NewBoard(rules, kDefaultShuffleIterations, /*seed=*/77,
                              [&](const Board& solved) {
                                  assert(HasLocalMatch(solved, 0, 0));
                                  solved_cells = solved.cells();
                              });
    assert(solved_cells == GenerateSolvedGrid(rules, 77).cells());

    Board manual = GenerateSolvedGrid(rules, 77);
    const auto stats = Shuffle(manual, kDefaultShuffleIterations);
    assert(generated.board.cells() == manual.cells());
    assert(generated.shuffle.iterations == stats.iterations);
}

void TestDescribeGrid() {
    Board board(MakeRules(3, 3), TileType::Apple);
    board.set(1, 0, TileType::Banana);
    board.set(2, 2, TileType::Kiwi);
    assert(DescribeGrid(board) == "A B A\nA A A\nA A K\n");
}

void TestTileNames() {
    assert(TileTypeName(TileType::Apple) == "Apple");
    assert(TileTypeName(TileType::Kiwi) == "Kiwi");
    assert(TileTypeFromIndex(3) == TileType::Banana);
    assert(!TileTypeFromIndex(0).has_value());
    assert(!TileTypeFromIndex(kMaxTileType + 1).has_value());
}

}  // namespace

int main() {
    TestSolvedGridFillsEveryCell();
    TestSolvedGridMatchesEverywhere();
    TestSolvedGridLaysRunsRightward();
    TestRejectsUnusableRules();
    TestPatternBoardHasNoMatches();
    TestMatchWindowCountsGaps();
    TestMatchAxesAreIndependent();
    TestShuffleRespectsCapAndPreservesTiles();
    TestShuffleStopsAtSmallCap();
    TestShuffleLeavesCleanBoardAlone();
    TestShuffleSurvivesSingleTileType();
    TestShuffleWithTwoTileTypes();
    TestNewBoardIsDeterministicForSeed();
    TestNewBoardReportsSolvedGrid();
    TestDescribeGrid();
    TestTileNames();
    std::cout << "All board tests passed.\n";
    return 0;
}
