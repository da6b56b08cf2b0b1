#include "project_paths.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

std::optional<std::filesystem::path> find_project_root(const std::filesystem::path& start) {
    std::filesystem::path current = start;

    while (current.has_relative_path()) {
        if (std::filesystem::exists(current / "project_paths.json")) {
            return current;
        }
        if (current.parent_path() == current) {
            break;
        }
        current = current.parent_path();
    }
    return std::nullopt;
}

std::filesystem::path get_project_path(const std::string& config_key, const std::vector<std::string>& extensions) {
    auto start_path = std::filesystem::current_path();
    auto project_root = find_project_root(start_path);
    if (!project_root) {
        std::cerr << "[Engine] ERROR: Project root not found above " << start_path << std::endl;
        return "";
    }
    std::filesystem::path config_path = *project_root / "project_paths.json";
    std::ifstream config_file(config_path);
    nlohmann::json config;
    try {
        config_file >> config;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[Engine] ERROR: Could not parse " << config_path << ": " << e.what() << std::endl;
        return "";
    }

    if (!config.contains(config_key)) {
        std::cerr << "[Engine] ERROR: Config key '" << config_key << "' not found in project_paths.json." << std::endl;
        return "";
    }
    std::filesystem::path project_path = config[config_key].get<std::string>();
    if (!project_path.is_absolute()) {
        project_path = *project_root / project_path;
    }
    const std::string extension = normalized_extension(project_path);
    if (!extensions.empty() &&
        std::find(extensions.begin(), extensions.end(), extension) == extensions.end()) {
        std::cerr << "[Engine] ERROR: Invalid file extension '" << extension << "'. Expected one of: ";
        for (const auto& ext : extensions) {
            std::cerr << ext << " ";
        }
        std::cerr << std::endl;
        return "";
    }

    return project_path.lexically_normal();
}
