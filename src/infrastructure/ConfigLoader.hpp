/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access configuration like the projects base path
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <string>

namespace pioneer::infrastructure {

/**
 * @struct AppSettings
 * @brief Values read from settings.json. Missing or invalid keys keep their defaults.
 */
struct AppSettings {
    std::string projectsBasePath;          ///< Root of every node's project directory.
    int debounceMs = 400;                  ///< Debounce window for content writes.
    int ioLanes = 2;                       ///< Background I/O lanes.
    std::string deletionPolicy = "orphan"; ///< "orphan" keeps disk content, "purge" removes it.
    bool namespaceByWorkspace = false;     ///< Nest project roots under the workspace name.
    std::size_t contextPrefixChars = 2000; ///< Main-file prefix handed to the LLM context.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from settingsDir, falling back to defaults.
     * @param settingsDir Directory holding settings.json.
     */
    static AppSettings Load(const std::string& settingsDir);

    /**
     * @brief Saves settings to settings.json, preserving unknown keys if possible.
     */
    static bool Save(const std::string& settingsDir, const AppSettings& settings, std::string& error);

    /**
     * @brief Checks that a base path is (or can become) a writable directory.
     * @param error Receives a user-facing description on failure.
     */
    static bool ValidateBasePath(const std::string& path, std::string& error);

    /**
     * @brief Validates then accepts a new base path and persists it.
     *        On failure the settings are left unchanged.
     */
    static bool SetProjectsBasePath(const std::string& settingsDir, AppSettings& settings,
                                    const std::string& path, std::string& error);
};

} // namespace pioneer::infrastructure
