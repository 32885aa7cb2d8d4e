/**
 * @file Identifiers.hpp
 * @brief Opaque identifier aliases shared by the workspace model.
 */

#pragma once

#include <string>

namespace pioneer::domain {

using NodeId = std::string; ///< Stable node identity (UUID string).
using FileId = std::string; ///< Stable project file identity (UUID string).

} // namespace pioneer::domain
