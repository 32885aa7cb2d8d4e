/**
 * @file Node.hpp
 * @brief Aggregate for one project on the canvas: metadata, owned files and connections.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Identifiers.hpp"
#include "domain/NodeType.hpp"
#include "domain/ProjectFile.hpp"
#include "domain/scaffold/Framework.hpp"

namespace pioneer::domain {

/**
 * @struct Position
 * @brief Canvas coordinate. Presentation only, persisted for continuity.
 */
struct Position {
    float x = 0.0f;
    float y = 0.0f;
};

/**
 * @class Node
 * @brief Owns an isolated file collection. Local invariants (unique file ids and
 *        paths, selection resolves, no self connection) are enforced here; the
 *        non-empty file set is maintained by the WorkspaceStore, which owns id
 *        generation.
 */
class Node {
public:
    Node(NodeId id, std::string name, NodeType type, scaffold::Framework framework, Position position = {});

    // --- Accessors ---
    const NodeId& getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    NodeType getType() const { return m_type; }
    scaffold::Framework getFramework() const { return m_framework; }
    CodeLanguage getLanguage() const { return m_language; }
    const Position& getPosition() const { return m_position; }
    const std::vector<ProjectFile>& getFiles() const { return m_files; }
    const std::optional<FileId>& getSelectedFileId() const { return m_selectedFileId; }
    const std::vector<NodeId>& getConnections() const { return m_connections; }
    const std::optional<std::string>& getProjectPath() const { return m_projectPath; }
    const std::optional<std::string>& getEnvironmentPath() const { return m_environmentPath; }

    // --- Metadata ---
    void setName(std::string name) { m_name = std::move(name); }
    void setType(NodeType type) { m_type = type; }
    void setPosition(Position position) { m_position = position; }

    /** @brief Switches the catalog entry; the language follows the framework. */
    void setFramework(scaffold::Framework framework);

    /** @brief Assigns the project root. Only the first assignment takes effect. */
    bool assignProjectPath(const std::string& path);
    bool assignEnvironmentPath(const std::string& path);

    /** @brief Forgets both paths so they can be derived again. */
    void clearStoragePaths() {
        m_projectPath.reset();
        m_environmentPath.reset();
    }

    // --- Files ---
    const ProjectFile* findFile(const FileId& fileId) const;
    ProjectFile* findFile(const FileId& fileId);
    const ProjectFile* findFileByPath(const std::string& path) const;

    /** @brief The file at the catalog main path, or the first file when none matches. */
    const ProjectFile* mainFile() const;

    /** @brief Appends a file. Fails on a duplicate id or path. */
    bool addFile(ProjectFile file);

    /**
     * @brief Removes a file. When it was selected, selection moves to the first
     *        remaining file (or clears if none remain).
     */
    bool removeFile(const FileId& fileId);

    /** @brief Changes a file's path and name. Fails on unknown id or path collision. */
    bool moveFile(const FileId& fileId, const std::string& newPath);

    bool selectFile(const FileId& fileId);
    void clearFileSelection() { m_selectedFileId.reset(); }

    // --- Connections ---
    bool connect(const NodeId& target);
    bool disconnect(const NodeId& target);
    bool isConnectedTo(const NodeId& target) const;

    /**
     * @brief Repairs state coming from an untrusted source (loaded documents):
     *        drops duplicate ids/paths, self connections, dangling selection.
     *        Does not refill an empty file set.
     */
    void normalize();

    /** @brief True when every local invariant holds and the file set is non-empty. */
    bool checkInvariants() const;

private:
    NodeId m_id;
    std::string m_name;
    NodeType m_type;
    scaffold::Framework m_framework;
    CodeLanguage m_language;
    Position m_position;
    std::vector<ProjectFile> m_files;
    std::optional<FileId> m_selectedFileId;
    std::vector<NodeId> m_connections;
    std::optional<std::string> m_projectPath;
    std::optional<std::string> m_environmentPath;
};

} // namespace pioneer::domain
