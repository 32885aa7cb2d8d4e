/**
 * @file PioneerApp.hpp
 * @brief Main application class for Pioneer.
 * @author Pioneer Team
 * @date 2026-10-17
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace pioneer::app {

/**
 * @class PioneerApp
 * @brief Headless driver: loads settings, wires the services and applies one
 *        command to a workspace document.
 */
class PioneerApp {
public:
    /**
     * @brief Parses arguments and runs a single command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Builds the service graph for a workspace.
     * @param workspaceName Used to namespace project roots when enabled in settings.
     */
    bool Init(const std::string& workspaceName);

    /** @brief Writes pending edits and stops the I/O lanes. */
    void Shutdown();

    bool OpenWorkspace(const std::string& path);
    bool SaveWorkspace(const std::string& path);

    int CmdNew(const std::vector<std::string>& args);
    int CmdAddNode(const std::vector<std::string>& args);
    int CmdDeleteNode(const std::vector<std::string>& args);
    int CmdConnect(const std::vector<std::string>& args);
    int CmdAddFile(const std::vector<std::string>& args);
    int CmdMaterialize(const std::vector<std::string>& args);
    int CmdList(const std::vector<std::string>& args);
    int CmdContext(const std::vector<std::string>& args);
    int CmdFrameworks();
    int CmdSetBasePath(const std::vector<std::string>& args);

    static void PrintUsage();

    std::string m_settingsDir;
    infrastructure::AppSettings m_settings;
    application::AppServices m_services;
};

} // namespace pioneer::app
