/**
 * @file ProjectFile.hpp
 * @brief Entity representing one file of a node's codebase.
 */

#pragma once

#include <string>
#include <utility>

#include "domain/CodeLanguage.hpp"
#include "domain/Identifiers.hpp"

namespace pioneer::domain {

/**
 * @struct ProjectFile
 * @brief A single source file held in memory. The content here is authoritative
 *        until it has been flushed to the node's project directory.
 */
struct ProjectFile {
    FileId id;                 ///< Stable identity, never reused.
    std::string path;          ///< Relative to the node's project root (e.g. "src/main.py").
    std::string name;          ///< Display name, normally the last path segment.
    std::string content;       ///< Full text content.
    CodeLanguage language = CodeLanguage::Scaffolding;

    ProjectFile() = default;
    ProjectFile(FileId fileId, std::string relPath, std::string text, CodeLanguage lang)
        : id(std::move(fileId)),
          path(std::move(relPath)),
          name(NameFromPath(path)),
          content(std::move(text)),
          language(lang) {}

    /** @brief Last segment of a '/'-separated relative path. */
    static std::string NameFromPath(const std::string& relPath) {
        auto pos = relPath.find_last_of('/');
        return pos == std::string::npos ? relPath : relPath.substr(pos + 1);
    }

    /** @brief Directory prefix including the trailing '/', or empty at the root. */
    static std::string DirectoryOf(const std::string& relPath) {
        auto pos = relPath.find_last_of('/');
        return pos == std::string::npos ? std::string() : relPath.substr(0, pos + 1);
    }
};

} // namespace pioneer::domain
