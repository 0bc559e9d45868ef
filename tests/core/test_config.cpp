#undef NDEBUG
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "gemgrid/core/GameConfig.hpp"

using namespace gemgrid::core;

namespace {

bool Rejects(const GameConfig& config) {
    try {
        config.Validate();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestDefaultsMatchReferenceBoard() {
    GameConfig config;
    config.Validate();
    const auto rules = config.board.rules();
    assert(rules.cols == 8);
    assert(rules.rows == 8);
    assert(rules.tile_types == 6);
    assert(rules.min_neighbors == 2);
    assert(rules.runLength() == 3);
    assert(config.board.max_shuffle_iterations == 200);
    assert(!config.board.seed.has_value());

    const auto settings = config.swap.settings();
    assert(settings.animated);
    assert(settings.duration == 0.5f);
    assert(settings.thresholds.self_distance == 0.5f);
    assert(settings.thresholds.neighbor_distance == 1.5f);
}

void TestSerializeRoundTrip() {
    GameConfig config;
    config.display_mode = "fullscreen";
    config.resolution = {{1920, 1080}};
    config.board.cols = 10;
    config.board.rows = 9;
    config.board.tile_types = 5;
    config.board.max_shuffle_iterations = 64;
    config.board.seed = 4242u;
    config.swap.animated = false;
    config.swap.duration = 0.25f;

    const auto restored = GameConfig::Deserialize(config.Serialize());
    assert(restored.display_mode == "fullscreen");
    assert(restored.resolution[0] == 1920 && restored.resolution[1] == 1080);
    assert(restored.board.cols == 10);
    assert(restored.board.rows == 9);
    assert(restored.board.tile_types == 5);
    assert(restored.board.max_shuffle_iterations == 64);
    assert(restored.board.seed == 4242u);
    assert(!restored.swap.animated);
    assert(restored.swap.duration == 0.25f);
    restored.Validate();
}

void TestPartialAndMistypedJson() {
    const auto config = GameConfig::Deserialize(
        R"({"board": {"cols": 12, "rows": "ten", "seed": -3}, "swap": {"duration": 1}, "extra": true})");
    assert(config.board.cols == 12);
    assert(config.board.rows == 8);
    assert(!config.board.seed.has_value());
    assert(config.swap.duration == 1.0f);
    assert(config.swap.animated);
    assert(config.display_mode == "windowed");
}

void TestMalformedJsonThrows() {
    bool threw = false;
    try {
        GameConfig::Deserialize("{\"board\": ");
    } catch (const Json::exception&) {
        threw = true;
    }
    assert(threw);
}

bool RejectsOnLoad(const std::string& json) {
    try {
        GameConfig::Deserialize(json);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestOutOfRangeIntegersAreRejected() {
    // 4294967304 would wrap to 8 if narrowed.
    assert(RejectsOnLoad(R"({"board": {"cols": 4294967304, "rows": 60000}})"));
    assert(RejectsOnLoad(R"({"board": {"rows": -4294967296}})"));
    assert(RejectsOnLoad(R"({"board": {"max_shuffle_iterations": 18446744073709551615}})"));
    assert(RejectsOnLoad(R"({"resolution": [4294968576, 720]})"));

    const auto config = GameConfig::Deserialize(R"({"board": {"cols": 2147483647}})");
    assert(config.board.cols == 2147483647);
    assert(Rejects(config));
}

void TestValidateRejectsHugeBoards() {
    GameConfig huge;
    huge.board.cols = 50000;
    huge.board.rows = 50000;
    assert(Rejects(huge));

    GameConfig wide;
    wide.board.cols = kMaxBoardSide + 1;
    assert(Rejects(wide));

    GameConfig largest;
    largest.board.cols = kMaxBoardSide;
    largest.board.rows = kMaxBoardSide;
    largest.Validate();

    GameConfig endless_runs;
    endless_runs.board.min_neighbors = 2147483647;
    assert(Rejects(endless_runs));
}

void TestValidateRejectsBadValues() {
    GameConfig small;
    small.board.rows = 2;
    assert(Rejects(small));

    GameConfig long_runs;
    long_runs.board.min_neighbors = 8;
    assert(Rejects(long_runs));

    GameConfig too_many_types;
    too_many_types.board.tile_types = kTileTypeCount + 1;
    assert(Rejects(too_many_types));

    GameConfig negative_cap;
    negative_cap.board.max_shuffle_iterations = -1;
    assert(Rejects(negative_cap));

    GameConfig zero_duration;
    zero_duration.swap.duration = 0.0f;
    assert(Rejects(zero_duration));

    GameConfig inverted;
    inverted.swap.self_distance = 1.5f;
    inverted.swap.neighbor_distance = 0.5f;
    assert(Rejects(inverted));

    GameConfig mode;
    mode.display_mode = "borderless";
    assert(Rejects(mode));

    GameConfig resolution;
    resolution.resolution = {{0, 720}};
    assert(Rejects(resolution));
}

}  // namespace

int main() {
    TestDefaultsMatchReferenceBoard();
    TestSerializeRoundTrip();
    TestPartialAndMistypedJson();
    TestMalformedJsonThrows();
    TestValidateRejectsBadValues();
    TestOutOfRangeIntegersAreRejected();
    TestValidateRejectsHugeBoards();
    std::cout << "All config tests passed.\n";
    return 0;
}
