/**
 * @file WorkspaceJson.hpp
 * @brief JSON codec for workspace documents.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Workspace.hpp"

namespace pioneer::infrastructure {

class WorkspaceJson {
public:
    /** @brief Serializes a document (pretty-printed, 2-space indent). */
    static std::string Serialize(const domain::WorkspaceDocument& doc);

    /**
     * @brief Parses a document. Unknown enum keys fall back to defaults; entries
     *        missing an id are skipped.
     * @param error Receives a description when the text is not a workspace document.
     * @return nullopt on malformed input.
     */
    static std::optional<domain::WorkspaceDocument> Parse(const std::string& text, std::string& error);

    static bool SaveToFile(const std::string& path, const domain::WorkspaceDocument& doc, std::string& error);
    static std::optional<domain::WorkspaceDocument> LoadFromFile(const std::string& path, std::string& error);
};

} // namespace pioneer::infrastructure
