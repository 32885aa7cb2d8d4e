/**
 * @file PathUtils.hpp
 * @brief XDG-aware locations for settings, project roots and runtime environments.
 */

#pragma once

#include <filesystem>
#include <string>

namespace pioneer::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_DATA_HOME, else ~/.local/share, else the working directory. */
    static std::filesystem::path GetDataHome();

    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();

    /** @brief Directory holding settings.json. */
    static std::filesystem::path GetSettingsDir();

    /** @brief Base path used until the user picks one. */
    static std::filesystem::path GetDefaultProjectsDir();

    /** @brief Parent of the per-node isolated environments. */
    static std::filesystem::path GetEnvironmentsDir();
};

} // namespace pioneer::infrastructure
