/**
 * @file ShellRuntimeProbe.cpp
 * @brief Implementation of ShellRuntimeProbe.
 */

#include "infrastructure/ShellRuntimeProbe.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <regex>

namespace pioneer::infrastructure {

namespace {

bool IsSafeToolName(const std::string& tool) {
    if (tool.empty()) return false;
    for (unsigned char c : tool) {
        if (!std::isalnum(c) && c != '-' && c != '_' && c != '.') return false;
    }
    return true;
}

} // namespace

std::optional<std::string> ShellRuntimeProbe::detectVersion(const domain::scaffold::RuntimeSpec& runtime) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cache.find(runtime.tool);
        if (it != m_cache.end()) return it->second;
    }

    std::optional<std::string> version;
    if (IsSafeToolName(runtime.tool) && HasTool(runtime.tool)) {
        // Some tools (java) print their version on stderr.
        version = ParseVersion(RunCommand(runtime.tool + " " + runtime.versionArgs + " 2>&1"));
        if (!version) {
            std::cerr << "[ShellRuntimeProbe] No version found in output of " << runtime.tool << std::endl;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache[runtime.tool] = version;
    return version;
}

std::optional<std::string> ShellRuntimeProbe::ParseVersion(const std::string& output) {
    static const std::regex versionPattern(R"((\d+)(\.\d+)+|(\d+))");
    std::smatch match;
    if (std::regex_search(output, match, versionPattern)) {
        return match.str(0);
    }
    return std::nullopt;
}

bool ShellRuntimeProbe::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

std::string ShellRuntimeProbe::RunCommand(const std::string& cmd) {
    std::string output;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output.append(buffer);
    }
    pclose(pipe);
    return output;
}

} // namespace pioneer::infrastructure
