/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access save locations and listing defaults
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <string>

namespace taskweave::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective settings after defaults are applied.
 */
struct AppConfig {
    std::string saveFile = ".taskweave"; ///< File name of the graph document.
    std::string dataDir;                 ///< Directory of the global save.
    std::string blueprintDir;            ///< Blueprint store directory.
    std::size_t defaultDepth = 0;        ///< Listing depth, 0 for unlimited.
    bool showArchived = false;           ///< Include archived nodes in listings.
    bool propagate = true;               ///< Propagate check/uncheck through the graph.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from @p configDir.
     *
     * Missing files give the defaults; unreadable files and mistyped keys are
     * logged and replaced by defaults.
     */
    static AppConfig Load(const std::string& configDir);

    /**
     * @brief Writes @p config to settings.json, preserving unknown keys if possible.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& configDir, const AppConfig& config);

    /** @brief Defaults with directories resolved through PathUtils. */
    static AppConfig Defaults();
};

} // namespace taskweave::infrastructure
