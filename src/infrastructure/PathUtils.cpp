#include "infrastructure/PathUtils.hpp"

#include <cstdlib>

namespace pioneer::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "pioneer";

fs::path XdgDir(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) return fs::path(value);

    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home) / homeRelative;

    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetSettingsDir() {
    return GetConfigHome() / kAppDir;
}

// Not created here: the base path is validated before anything is written under it.
fs::path PathUtils::GetDefaultProjectsDir() {
    return GetDataHome() / kAppDir / "projects";
}

fs::path PathUtils::GetEnvironmentsDir() {
    return GetDataHome() / kAppDir / "environments";
}

} // namespace pioneer::infrastructure
