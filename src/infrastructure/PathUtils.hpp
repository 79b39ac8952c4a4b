/**
 * @file PathUtils.hpp
 * @brief XDG base-directory lookups for settings and profile data.
 */

#pragma once
#include <filesystem>

namespace smartcook::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();
    /** @brief $XDG_DATA_HOME, else ~/.local/share, else the working directory. */
    static std::filesystem::path GetDataHome();

    static std::filesystem::path GetDefaultSettingsPath();
    static std::filesystem::path GetDefaultProfilesPath();

private:
    static std::filesystem::path XdgBase(const char* variable, const std::filesystem::path& homeRelative);
};

} // namespace smartcook::infrastructure
