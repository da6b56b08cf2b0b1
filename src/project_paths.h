//
// project_paths.h - Locate files named in project_paths.json
//

#ifndef SMOKEFLOW_PROJECT_PATHS_H
#define SMOKEFLOW_PROJECT_PATHS_H

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Lower-cased extension of path, including the leading dot
inline std::string normalized_extension(const std::filesystem::path& path) {
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

// Walks up from start until a directory containing project_paths.json is found
std::optional<std::filesystem::path> find_project_root(const std::filesystem::path& start);
// Resolves config_key from project_paths.json against the project root.
// Returns an empty path if the root, the file or the key is missing, or if
// the extension is not one of extensions (when given).
std::filesystem::path get_project_path(const std::string& config_key, const std::vector<std::string>& extensions);

#endif //SMOKEFLOW_PROJECT_PATHS_H
