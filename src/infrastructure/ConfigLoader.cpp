/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include "infrastructure/PathUtils.hpp"

namespace taskweave::infrastructure {

namespace {

template <typename T>
T ReadKey(const nlohmann::json& j, const char* key, const T& fallback) {
    if (!j.contains(key)) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
        return fallback;
    }
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    config.dataDir = PathUtils::GetAppDataDir().string();
    config.blueprintDir = PathUtils::GetBlueprintsDir().string();
    return config;
}

AppConfig ConfigLoader::Load(const std::string& configDir) {
    AppConfig config = Defaults();

    std::filesystem::path configPath = std::filesystem::path(configDir) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
        return config;
    }

    config.saveFile = ReadKey<std::string>(j, "save_file", config.saveFile);
    config.dataDir = ReadKey<std::string>(j, "data_dir", config.dataDir);
    // The blueprint store follows data_dir unless it is set explicitly.
    config.blueprintDir = ReadKey<std::string>(
        j, "blueprint_dir", (std::filesystem::path(config.dataDir) / "blueprints").string());
    long long depth = ReadKey<long long>(j, "default_depth", static_cast<long long>(config.defaultDepth));
    if (depth < 0) {
        std::cerr << "[ConfigLoader] Ignoring negative default_depth " << depth << std::endl;
    } else {
        config.defaultDepth = static_cast<std::size_t>(depth);
    }
    config.showArchived = ReadKey<bool>(j, "show_archived", config.showArchived);
    config.propagate = ReadKey<bool>(j, "propagate", config.propagate);

    if (config.saveFile.empty()) {
        std::cerr << "[ConfigLoader] Empty save_file, using default" << std::endl;
        config.saveFile = AppConfig().saveFile;
    }
    return config;
}

bool ConfigLoader::Save(const std::string& configDir, const AppConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["save_file"] = config.saveFile;
    j["data_dir"] = config.dataDir;
    j["blueprint_dir"] = config.blueprintDir;
    j["default_depth"] = config.defaultDepth;
    j["show_archived"] = config.showArchived;
    j["propagate"] = config.propagate;

    try {
        std::filesystem::create_directories(configDir);
        std::ofstream f(configPath);
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
        return false;
    }
}

} // namespace taskweave::infrastructure
