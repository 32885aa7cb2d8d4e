/**
 * @file Workspace.hpp
 * @brief Plain snapshot of the whole workspace, used for viewers and documents.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/Node.hpp"

namespace pioneer::domain {

/**
 * @struct CanvasTransform
 * @brief Pan/zoom state of the canvas. Scale is always within [kMinScale, kMaxScale].
 */
struct CanvasTransform {
    static constexpr float kMinScale = 0.5f;
    static constexpr float kMaxScale = 2.0f;

    Position offset;
    float scale = 1.0f;

    static float ClampScale(float value) {
        return std::clamp(value, kMinScale, kMaxScale);
    }
};

/**
 * @struct WorkspaceDocument
 * @brief Serializable state of a workspace (nodes in canvas order).
 */
struct WorkspaceDocument {
    std::string version = "1.0";
    std::string name = "Untitled Project";
    std::int64_t createdMs = 0;   ///< Milliseconds since epoch.
    std::int64_t modifiedMs = 0;  ///< Milliseconds since epoch.
    CanvasTransform canvas;
    std::optional<NodeId> selectedNodeId;
    std::vector<Node> nodes;
};

} // namespace pioneer::domain
