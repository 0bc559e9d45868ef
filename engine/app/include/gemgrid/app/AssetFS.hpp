#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gemgrid::app {

bool FileExists(const std::filesystem::path& path);

const std::vector<std::filesystem::path>& AssetRoots();

// First existing match under the asset roots, or the bare filename.
std::filesystem::path AssetPath(const std::string& filename);

std::optional<std::filesystem::path> FindAsset(const std::string& filename);

}  // namespace gemgrid::app
