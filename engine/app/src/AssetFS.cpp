#include "gemgrid/app/AssetFS.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace gemgrid::app {

namespace {

void PushIfExists(std::vector<std::filesystem::path>& roots, const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return;
    }
    if (std::find(roots.begin(), roots.end(), path) == roots.end()) {
        roots.push_back(path);
    }
}

void HarvestAssetDirs(std::vector<std::filesystem::path>& roots,
                      const std::filesystem::path& start,
                      int max_depth) {
    if (start.empty()) {
        return;
    }
    std::filesystem::path cursor = start;
    for (int depth = 0; depth < max_depth && !cursor.empty(); ++depth) {
        PushIfExists(roots, cursor / "assets");
        PushIfExists(roots, cursor / "assets_common");
        const auto parent = cursor.parent_path();
        if (parent == cursor) {
            break;
        }
        cursor = parent;
    }
}

}  // namespace

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

const std::vector<std::filesystem::path>& AssetRoots() {
    static std::vector<std::filesystem::path> roots;
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (const char* env = std::getenv("GEMGRID_ASSETS")) {
            PushIfExists(roots, std::filesystem::path(env));
            HarvestAssetDirs(roots, std::filesystem::path(env), 2);
        }

        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            HarvestAssetDirs(roots, cwd, 8);
        }

        if (char* raw_base = SDL_GetBasePath()) {
            std::filesystem::path base_path(raw_base);
            SDL_free(raw_base);
            HarvestAssetDirs(roots, base_path, 8);
        }

        if (roots.empty() && !ec) {
            PushIfExists(roots, cwd);
        }
    });
    return roots;
}

std::optional<std::filesystem::path> FindAsset(const std::string& filename) {
    for (const auto& root : AssetRoots()) {
        std::filesystem::path candidate = root / filename;
        if (FileExists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::filesystem::path AssetPath(const std::string& filename) {
    if (auto found = FindAsset(filename)) {
        return *found;
    }
    return std::filesystem::path(filename);
}

}  // namespace gemgrid::app
