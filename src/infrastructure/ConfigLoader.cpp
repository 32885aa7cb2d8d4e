/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace pioneer::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path SettingsFile(const std::string& settingsDir) {
    return fs::path(settingsDir) / "settings.json";
}

} // namespace

AppSettings ConfigLoader::Load(const std::string& settingsDir) {
    AppSettings settings;
    settings.projectsBasePath = PathUtils::GetDefaultProjectsDir().string();

    fs::path configPath = SettingsFile(settingsDir);
    if (!fs::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("projects_base_path") && j["projects_base_path"].is_string()) {
            std::string base = j["projects_base_path"].get<std::string>();
            if (!base.empty()) settings.projectsBasePath = base;
        }
        if (j.contains("debounce_ms") && j["debounce_ms"].is_number_integer()) {
            settings.debounceMs = std::clamp(j["debounce_ms"].get<int>(), 0, 10000);
        }
        if (j.contains("io_lanes") && j["io_lanes"].is_number_integer()) {
            settings.ioLanes = std::clamp(j["io_lanes"].get<int>(), 1, 16);
        }
        if (j.contains("deletion_policy") && j["deletion_policy"].is_string()) {
            std::string policy = j["deletion_policy"].get<std::string>();
            if (policy == "orphan" || policy == "purge") {
                settings.deletionPolicy = policy;
            } else {
                std::cerr << "[ConfigLoader] Unknown deletion_policy '" << policy << "', using orphan." << std::endl;
            }
        }
        if (j.contains("namespace_by_workspace") && j["namespace_by_workspace"].is_boolean()) {
            settings.namespaceByWorkspace = j["namespace_by_workspace"].get<bool>();
        }
        if (j.contains("context_prefix_chars") && j["context_prefix_chars"].is_number_unsigned()) {
            auto chars = j["context_prefix_chars"].get<std::size_t>();
            if (chars > 0) settings.contextPrefixChars = chars;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return settings;
}

bool ConfigLoader::Save(const std::string& settingsDir, const AppSettings& settings, std::string& error) {
    fs::path configPath = SettingsFile(settingsDir);
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Replacing unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["projects_base_path"] = settings.projectsBasePath;
    j["debounce_ms"] = settings.debounceMs;
    j["io_lanes"] = settings.ioLanes;
    j["deletion_policy"] = settings.deletionPolicy;
    j["namespace_by_workspace"] = settings.namespaceByWorkspace;
    j["context_prefix_chars"] = settings.contextPrefixChars;

    if (!AtomicFileWriter::Write(configPath, j.dump(4), error)) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << error << std::endl;
        return false;
    }
    return true;
}

bool ConfigLoader::ValidateBasePath(const std::string& path, std::string& error) {
    if (path.empty()) {
        error = "The projects folder path is empty.";
        return false;
    }

    std::error_code ec;
    fs::path base(path);
    if (fs::exists(base, ec)) {
        if (!fs::is_directory(base, ec)) {
            error = "Not a directory: " + path;
            return false;
        }
    } else if (!fs::create_directories(base, ec) || ec) {
        error = "Couldn't create projects folder " + path + (ec ? ": " + ec.message() : "");
        return false;
    }

    // Writability probe
    fs::path probe = base / ".pioneer-write-test";
    {
        std::ofstream out(probe);
        if (!out.is_open()) {
            error = "Projects folder is not writable: " + path;
            return false;
        }
    }
    fs::remove(probe, ec);
    return true;
}

bool ConfigLoader::SetProjectsBasePath(const std::string& settingsDir, AppSettings& settings,
                                       const std::string& path, std::string& error) {
    if (!ValidateBasePath(path, error)) {
        return false;
    }
    AppSettings updated = settings;
    updated.projectsBasePath = path;
    if (!Save(settingsDir, updated, error)) {
        return false;
    }
    settings = updated;
    return true;
}

} // namespace pioneer::infrastructure
