#include "gemgrid/app/Bootstrap.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "gemgrid/app/AssetFS.hpp"

namespace gemgrid::app {

core::GameConfig LoadGameConfig() {
    const auto path = FindAsset(kConfigFilename);
    if (!path) {
        SDL_Log("%s not found, using defaults", kConfigFilename);
        return core::GameConfig{};
    }

    std::ifstream file(*path);
    if (!file) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unable to open %s, using defaults",
                    path->string().c_str());
        return core::GameConfig{};
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    try {
        core::GameConfig config = core::GameConfig::Deserialize(contents.str());
        config.Validate();
        SDL_Log("Loaded config from %s", path->string().c_str());
        return config;
    } catch (const core::Json::exception& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Malformed %s (%s), using defaults",
                    path->string().c_str(), e.what());
    } catch (const std::invalid_argument& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Invalid %s (%s), using defaults",
                    path->string().c_str(), e.what());
    }
    return core::GameConfig{};
}

void LogGrid(const std::string& title, const core::Board& board) {
    SDL_Log("---------------------------------------");
    SDL_Log("%s", title.c_str());
    std::istringstream lines(core::DescribeGrid(board));
    std::string line;
    while (std::getline(lines, line)) {
        SDL_Log("%s", line.c_str());
    }
    SDL_Log("---------------------------------------");
}

core::GeneratedBoard GenerateMatchGrid(const core::BoardConfig& config, std::uint32_t seed) {
    core::GeneratedBoard generated = core::NewBoard(
        config.rules(), config.max_shuffle_iterations, seed, [seed](const core::Board& solved) {
            LogGrid("Generating initial grid (seed " + std::to_string(seed) + "):", solved);
        });
    LogGrid("Final grid in: " + std::to_string(generated.shuffle.iterations) + " iterations",
            generated.board);

    if (generated.shuffle.fallback_picks > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Shuffle fell back to a scan %d times; too few tile types?",
                    generated.shuffle.fallback_picks);
    }
    if (!generated.shuffle.converged) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Shuffle stopped at %d passes with local matches left",
                    generated.shuffle.iterations);
    }
    return generated;
}

}  // namespace gemgrid::app
