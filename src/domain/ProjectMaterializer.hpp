/**
 * @file ProjectMaterializer.hpp
 * @brief Interface for writing a node's scaffold and files to persistent storage.
 */

#pragma once

#include <string>

#include "domain/Node.hpp"

namespace pioneer::domain {

/**
 * @class ProjectMaterializer
 * @brief Translates a node's in-memory file set into an on-disk project tree.
 *
 * Every operation is synchronous and reports failure through its return value plus
 * an error message; none of them throws. Callers serialize access per node.
 */
class ProjectMaterializer {
public:
    virtual ~ProjectMaterializer() = default;

    /** @brief Deterministic project root for a node id. */
    virtual std::string projectRootFor(const NodeId& nodeId) const = 0;

    /** @brief Deterministic isolated-environment location for a node id. */
    virtual std::string environmentPathFor(const NodeId& nodeId) const = 0;

    /**
     * @brief Creates root, scaffold directories, manifest (once), seed files (when
     *        absent) and writes every listed file. Idempotent; unlisted files survive.
     */
    virtual bool createProjectStructure(const Node& node, std::string& error) = 0;

    /** @brief Writes one file's content to its resolved absolute path. */
    virtual bool saveFile(const Node& node, const ProjectFile& file, std::string& error) = 0;

    /** @brief Removes a file's on-disk counterpart. A missing file is not an error. */
    virtual bool deleteFile(const Node& node, const ProjectFile& file, std::string& error) = 0;

    /** @brief Renames a file on disk. Paths are relative to the project root. */
    virtual bool renameFile(const Node& node, const std::string& oldPath,
                            const std::string& newPath, std::string& error) = 0;

    /** @brief Removes the node's whole project root (purge deletion policy). */
    virtual bool removeProjectRoot(const Node& node, std::string& error) = 0;
};

} // namespace pioneer::domain
