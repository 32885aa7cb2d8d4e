/**
 * @file RuntimeProbe.hpp
 * @brief Interface for best-effort detection of installed toolchain versions.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/scaffold/ScaffoldCatalog.hpp"

namespace pioneer::domain {

class RuntimeProbe {
public:
    virtual ~RuntimeProbe() = default;

    /**
     * @brief Detects the installed version of a runtime.
     * @return nullopt when the tool is missing or its output has no version.
     */
    virtual std::optional<std::string> detectVersion(const scaffold::RuntimeSpec& runtime) = 0;
};

} // namespace pioneer::domain
