#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace smartcook::infrastructure {

namespace fs = std::filesystem;

namespace {
const char* const kAppDir = "SmartCook";
}

fs::path PathUtils::XdgBase(const char* variable, const fs::path& homeRelative) {
    if (const char* value = std::getenv(variable); value && *value) {
        return fs::path(value);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

fs::path PathUtils::GetConfigHome() {
    return XdgBase("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDataHome() {
    return XdgBase("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / kAppDir / "settings.json";
}

fs::path PathUtils::GetDefaultProfilesPath() {
    return GetDataHome() / kAppDir / "profiles.json";
}

} // namespace smartcook::infrastructure
