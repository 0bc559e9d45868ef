#include "gemgrid/core/GameConfig.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace gemgrid::core {

namespace {

// Integers that do not fit an int are rejected rather than truncated.
int CheckedInt(const Json& value, const char* key) {
    constexpr auto kMax = static_cast<std::int64_t>(std::numeric_limits<int>::max());
    constexpr auto kMin = static_cast<std::int64_t>(std::numeric_limits<int>::min());
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMax)) {
            throw std::invalid_argument(std::string(key) + " is out of range");
        }
        return static_cast<int>(value.get<std::uint64_t>());
    }
    const auto wide = value.get<std::int64_t>();
    if (wide < kMin || wide > kMax) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    return static_cast<int>(wide);
}

void ReadInt(const Json& json, const char* key, int& out) {
    if (json.contains(key) && json[key].is_number_integer()) {
        out = CheckedInt(json[key], key);
    }
}

void ReadFloat(const Json& json, const char* key, float& out) {
    if (json.contains(key) && json[key].is_number()) {
        out = json[key].get<float>();
    }
}

}  // namespace

Board::Rules BoardConfig::rules() const {
    Board::Rules rules;
    rules.cols = cols;
    rules.rows = rows;
    rules.tile_types = tile_types;
    rules.min_neighbors = min_neighbors;
    return rules;
}

SwapSettings SwapConfig::settings() const {
    SwapSettings settings;
    settings.animated = animated;
    settings.duration = duration;
    settings.thresholds.self_distance = self_distance;
    settings.thresholds.neighbor_distance = neighbor_distance;
    return settings;
}

void GameConfig::Validate() const {
    if (display_mode != "windowed" && display_mode != "fullscreen") {
        throw std::invalid_argument("display_mode must be \"windowed\" or \"fullscreen\"");
    }
    if (resolution[0] <= 0 || resolution[1] <= 0) {
        throw std::invalid_argument("resolution must be positive");
    }
    ValidateRules(board.rules());
    if (board.max_shuffle_iterations < 0) {
        throw std::invalid_argument("max_shuffle_iterations must not be negative");
    }
    ValidateSwapSettings(swap.settings());
}

Json GameConfig::ToJson() const {
    Json json;
    json["display_mode"] = display_mode;
    json["resolution"] = {resolution[0], resolution[1]};

    Json board_json;
    board_json["cols"] = board.cols;
    board_json["rows"] = board.rows;
    board_json["tile_types"] = board.tile_types;
    board_json["min_neighbors"] = board.min_neighbors;
    board_json["max_shuffle_iterations"] = board.max_shuffle_iterations;
    if (board.seed) {
        board_json["seed"] = *board.seed;
    }
    json["board"] = board_json;

    Json swap_json;
    swap_json["animated"] = swap.animated;
    swap_json["duration"] = swap.duration;
    swap_json["neighbor_distance"] = swap.neighbor_distance;
    swap_json["self_distance"] = swap.self_distance;
    json["swap"] = swap_json;
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (json.contains("display_mode") && json["display_mode"].is_string()) {
        config.display_mode = json["display_mode"].get<std::string>();
    }
    if (json.contains("resolution") && json["resolution"].is_array() &&
        json["resolution"].size() == 2) {
        const Json& resolution = json["resolution"];
        if (resolution[0].is_number_integer() && resolution[1].is_number_integer()) {
            config.resolution[0] = CheckedInt(resolution[0], "resolution");
            config.resolution[1] = CheckedInt(resolution[1], "resolution");
        }
    }

    if (json.contains("board") && json["board"].is_object()) {
        const Json& board_json = json["board"];
        ReadInt(board_json, "cols", config.board.cols);
        ReadInt(board_json, "rows", config.board.rows);
        ReadInt(board_json, "tile_types", config.board.tile_types);
        ReadInt(board_json, "min_neighbors", config.board.min_neighbors);
        ReadInt(board_json, "max_shuffle_iterations", config.board.max_shuffle_iterations);
        if (board_json.contains("seed") && board_json["seed"].is_number_unsigned()) {
            config.board.seed = board_json["seed"].get<std::uint32_t>();
        }
    }

    if (json.contains("swap") && json["swap"].is_object()) {
        const Json& swap_json = json["swap"];
        if (swap_json.contains("animated") && swap_json["animated"].is_boolean()) {
            config.swap.animated = swap_json["animated"].get<bool>();
        }
        ReadFloat(swap_json, "duration", config.swap.duration);
        ReadFloat(swap_json, "neighbor_distance", config.swap.neighbor_distance);
        ReadFloat(swap_json, "self_distance", config.swap.self_distance);
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump();
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace gemgrid::core
