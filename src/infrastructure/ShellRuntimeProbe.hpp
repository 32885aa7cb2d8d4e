/**
 * @file ShellRuntimeProbe.hpp
 * @brief RuntimeProbe that asks installed tools for their version through the shell.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "domain/RuntimeProbe.hpp"

namespace pioneer::infrastructure {

/**
 * @class ShellRuntimeProbe
 * @brief Runs "<tool> <args>" once per tool and caches the parsed version.
 *        Missing tools and unparsable output are reported as nullopt.
 */
class ShellRuntimeProbe : public domain::RuntimeProbe {
public:
    std::optional<std::string> detectVersion(const domain::scaffold::RuntimeSpec& runtime) override;

    /** @brief Extracts the first dotted version number ("v20.11.0" -> "20.11.0"). */
    static std::optional<std::string> ParseVersion(const std::string& output);

private:
    static bool HasTool(const std::string& tool);
    static std::string RunCommand(const std::string& cmd);

    std::mutex m_mutex;
    std::map<std::string, std::optional<std::string>> m_cache;
};

} // namespace pioneer::infrastructure
