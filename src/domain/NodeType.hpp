/**
 * @file NodeType.hpp
 * @brief Value Object describing what kind of project a node represents.
 */

#pragma once

#include <string>

namespace pioneer::domain {

/**
 * @enum NodeType
 * @brief Closed set of project kinds that can be placed on the canvas.
 */
enum class NodeType {
    MacOSApp,      ///< Desktop application.
    IPhoneApp,     ///< Mobile application.
    Website,       ///< Website or web service.
    CloudBackend,  ///< Cloud backend (deployment target).
    Custom         ///< Anything else.
};

/**
 * @brief Stable key used in workspace documents.
 */
inline std::string NodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::MacOSApp: return "macos_app";
        case NodeType::IPhoneApp: return "iphone_app";
        case NodeType::Website: return "website";
        case NodeType::CloudBackend: return "cloud_backend";
        case NodeType::Custom: return "custom";
        default: return "custom";
    }
}

/**
 * @brief Human readable label for display and generated READMEs.
 */
inline std::string NodeTypeDisplayName(NodeType type) {
    switch (type) {
        case NodeType::MacOSApp: return "macOS App";
        case NodeType::IPhoneApp: return "iPhone App";
        case NodeType::Website: return "Website";
        case NodeType::CloudBackend: return "Cloud Backend";
        case NodeType::Custom: return "Custom";
        default: return "Custom";
    }
}

inline NodeType NodeTypeFromString(const std::string& key) {
    if (key == "macos_app") return NodeType::MacOSApp;
    if (key == "iphone_app") return NodeType::IPhoneApp;
    if (key == "website") return NodeType::Website;
    if (key == "cloud_backend") return NodeType::CloudBackend;
    return NodeType::Custom;
}

} // namespace pioneer::domain
