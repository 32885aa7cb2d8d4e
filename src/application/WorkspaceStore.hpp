/**
 * @file WorkspaceStore.hpp
 * @brief Single source of truth for the node graph, selection and canvas.
 *
 * Every mutation goes through this class. Callers hold ids, never references into
 * the store; each operation re-resolves its ids under the store mutex and is a
 * no-op when they no longer resolve. Disk effects are delegated to the
 * PersistenceCoordinator with snapshots taken under the lock.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "application/ContextAssembler.hpp"
#include "application/PersistenceCoordinator.hpp"
#include "domain/ProjectMaterializer.hpp"
#include "domain/Workspace.hpp"

namespace pioneer::application {

/**
 * @enum DeletionPolicy
 * @brief What happens to a node's project directory when the node is deleted.
 */
enum class DeletionPolicy {
    Orphan, ///< Directory stays on disk.
    Purge   ///< Directory is removed.
};

/** @brief Parses "orphan" / "purge"; anything else is Orphan. */
DeletionPolicy DeletionPolicyFromString(const std::string& value);

enum class RenameOutcome {
    Applied,
    NotFound,
    Rejected,
    DiskFailure
};

struct RenameResult {
    RenameOutcome outcome = RenameOutcome::NotFound;
    std::string error;

    bool ok() const { return outcome == RenameOutcome::Applied; }
};

enum class WorkspaceEventKind {
    NodeCreated,
    NodeDeleted,
    NodeUpdated,
    FileAdded,
    FileRemoved,
    FileRenamed,
    FileContentChanged,
    SelectionChanged,
    ConnectionsChanged,
    CanvasChanged,
    WorkspaceReplaced
};

/**
 * @struct WorkspaceEvent
 * @brief Change notification. Ids are only hints; viewers re-read through accessors.
 */
struct WorkspaceEvent {
    WorkspaceEventKind kind;
    std::optional<domain::NodeId> nodeId;
    std::optional<domain::FileId> fileId;
};

/**
 * @struct WorkspaceStoreOptions
 * @brief Construction-time settings of a WorkspaceStore.
 */
struct WorkspaceStoreOptions {
    DeletionPolicy deletionPolicy = DeletionPolicy::Orphan;
    std::size_t contextPrefixChars = 2000;
    std::function<std::string()> idSource;  ///< Defaults to random UUIDs.
    std::string workspaceName = "Untitled Project";
};

class WorkspaceStore {
public:
    using Listener = std::function<void(const WorkspaceEvent&)>;
    using IdSource = std::function<std::string()>;
    using Options = WorkspaceStoreOptions;

    /**
     * @param materializer Used for path derivation and by scheduled disk jobs.
     * @param coordinator Executes every disk effect. Must outlive the store's jobs.
     */
    WorkspaceStore(std::shared_ptr<domain::ProjectMaterializer> materializer,
                   std::shared_ptr<PersistenceCoordinator> coordinator,
                   Options options = Options());

    // --- Nodes ---

    /** @brief Creates a node with one catalog main file, selects it and schedules materialization. */
    domain::NodeId createNode(domain::NodeType type, domain::scaffold::Framework framework);
    domain::NodeId createNode(domain::NodeType type, domain::scaffold::Framework framework,
                              const std::string& name, domain::Position position);

    /** @brief Removes a node and every connection pointing at it. */
    bool deleteNode(const domain::NodeId& nodeId);

    bool renameNode(const domain::NodeId& nodeId, const std::string& name);
    bool moveNode(const domain::NodeId& nodeId, domain::Position position);

    /**
     * @brief Switches framework and language. The new framework's main file is created
     *        when missing and becomes the selected file; the scaffold is re-materialized.
     */
    bool changeFramework(const domain::NodeId& nodeId, domain::scaffold::Framework framework);

    // --- Selection (flush-before-switch) ---
    bool selectNode(const domain::NodeId& nodeId);
    bool selectFile(const domain::NodeId& nodeId, const domain::FileId& fileId);
    void clearSelection();

    // --- Files ---
    bool updateFileContent(const domain::NodeId& nodeId, const domain::FileId& fileId, const std::string& content);

    /**
     * @brief Renames a file within its directory. On disk failure the in-memory
     *        path and name are restored and the error is returned.
     */
    RenameResult renameFile(const domain::NodeId& nodeId, const domain::FileId& fileId, const std::string& newName);

    /**
     * @brief Adds an empty file at a relative path and selects it.
     * @param language Inferred from the extension when not given.
     */
    std::optional<domain::FileId> addFile(const domain::NodeId& nodeId, const std::string& path,
                                          std::optional<domain::CodeLanguage> language = std::nullopt);

    /** @brief Removes a file; the last file is replaced by a fresh main file. */
    bool removeFile(const domain::NodeId& nodeId, const domain::FileId& fileId);

    // --- Connections ---

    /** @brief True when the edge exists afterwards. Self-loops and unknown ids are rejected. */
    bool connect(const domain::NodeId& fromId, const domain::NodeId& toId);

    /** @brief True when an edge was removed. */
    bool disconnect(const domain::NodeId& fromId, const domain::NodeId& toId);

    // --- Canvas ---
    void setCanvasOffset(domain::Position offset);
    void panCanvas(float dx, float dy);
    void setCanvasScale(float scale);
    void resetCanvas();

    // --- Viewer accessors (copies) ---
    std::optional<domain::Node> getNode(const domain::NodeId& nodeId) const;
    std::optional<domain::ProjectFile> getFile(const domain::NodeId& nodeId, const domain::FileId& fileId) const;
    std::vector<domain::NodeId> nodeIds() const;
    std::size_t nodeCount() const;
    std::optional<domain::NodeId> selectedNodeId() const;
    std::optional<domain::ProjectFile> selectedFile() const;
    domain::CanvasTransform canvas() const;
    std::string workspaceName() const;
    domain::WorkspaceDocument snapshot() const;

    // --- Documents ---

    /** @brief Snapshot stamped with the current modification time. */
    domain::WorkspaceDocument exportDocument();

    /**
     * @brief Replaces the graph with an imported document, repairing invariants
     *        (duplicate ids, empty file sets, dangling selection and connections)
     *        and re-materializing every node.
     */
    void loadDocument(domain::WorkspaceDocument doc);

    /** @brief Flushes pending writes and starts an empty workspace. */
    void newWorkspace(const std::string& name);

    // --- Misc ---

    /** @brief Context for the LLM. prefixChars == 0 uses the configured default. */
    std::optional<ContextBundle> buildContext(const domain::NodeId& nodeId, std::size_t prefixChars = 0) const;

    /** @brief Blocks until every pending write and queued job has completed. */
    void flushAll();

    std::size_t subscribe(Listener listener);
    void unsubscribe(std::size_t token);

    DeletionPolicy deletionPolicy() const { return m_options.deletionPolicy; }

private:
    using Events = std::vector<WorkspaceEvent>;

    domain::Node* findLocked(const domain::NodeId& nodeId);
    const domain::Node* findLocked(const domain::NodeId& nodeId) const;

    domain::NodeId createNodeImpl(domain::NodeType type, domain::scaffold::Framework framework,
                                  std::optional<std::string> name, std::optional<domain::Position> position);

    domain::ProjectFile makeMainFile(const domain::Node& node);
    bool ensureFilesLocked(domain::Node& node);
    void flushSelectionLocked();
    void flushFileSelectionLocked(const domain::Node& node);
    void scheduleStructureLocked(const domain::Node& node, const std::string& reason);
    domain::WorkspaceDocument snapshotLocked() const;
    void resetLocked(const std::string& name);
    void publish(const Events& events);

    static std::int64_t NowMs();
    static bool IsValidRelativePath(const std::string& path);

    std::shared_ptr<domain::ProjectMaterializer> m_materializer;
    std::shared_ptr<PersistenceCoordinator> m_coordinator;
    Options m_options;

    mutable std::mutex m_mutex;
    std::unordered_map<domain::NodeId, domain::Node> m_nodes;
    std::vector<domain::NodeId> m_order;
    std::optional<domain::NodeId> m_selectedNodeId;
    domain::CanvasTransform m_canvas;
    std::string m_name;
    std::int64_t m_createdMs = 0;

    std::mutex m_listenersMutex;
    std::map<std::size_t, Listener> m_listeners;
    std::size_t m_nextToken = 1;
};

} // namespace pioneer::application
