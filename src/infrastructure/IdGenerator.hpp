/**
 * @file IdGenerator.hpp
 * @brief Generates opaque, never-reused identifiers for nodes and files.
 */

#pragma once

#include <string>

namespace pioneer::infrastructure {

class IdGenerator {
public:
    /** @brief Returns a random (version 4) UUID in lower-case canonical form. */
    static std::string NewId();
};

} // namespace pioneer::infrastructure
