/**
 * @file WorkspaceStore.cpp
 * @brief Implementation of WorkspaceStore.
 */

#include "application/WorkspaceStore.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "domain/scaffold/ScaffoldCatalog.hpp"
#include "infrastructure/IdGenerator.hpp"

namespace pioneer::application {

using domain::Node;
using domain::NodeId;
using domain::FileId;
using domain::ProjectFile;
using domain::scaffold::ScaffoldCatalog;

DeletionPolicy DeletionPolicyFromString(const std::string& value) {
    return value == "purge" ? DeletionPolicy::Purge : DeletionPolicy::Orphan;
}

WorkspaceStore::WorkspaceStore(std::shared_ptr<domain::ProjectMaterializer> materializer,
                               std::shared_ptr<PersistenceCoordinator> coordinator,
                               Options options)
    : m_materializer(std::move(materializer)),
      m_coordinator(std::move(coordinator)),
      m_options(std::move(options)),
      m_name(m_options.workspaceName),
      m_createdMs(NowMs()) {
    if (!m_options.idSource) {
        m_options.idSource = [] { return infrastructure::IdGenerator::NewId(); };
    }
}

std::int64_t WorkspaceStore::NowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool WorkspaceStore::IsValidRelativePath(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.back() == '/') return false;
    if (path.find('\\') != std::string::npos) return false;

    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") return false;
        start = end + 1;
    }
    return true;
}

Node* WorkspaceStore::findLocked(const NodeId& nodeId) {
    auto it = m_nodes.find(nodeId);
    return it == m_nodes.end() ? nullptr : &it->second;
}

const Node* WorkspaceStore::findLocked(const NodeId& nodeId) const {
    auto it = m_nodes.find(nodeId);
    return it == m_nodes.end() ? nullptr : &it->second;
}

ProjectFile WorkspaceStore::makeMainFile(const Node& node) {
    const auto& entry = ScaffoldCatalog::Lookup(node.getFramework());
    domain::scaffold::TemplateVars vars;
    vars.name = node.getName();
    vars.typeLabel = domain::NodeTypeDisplayName(node.getType());
    if (entry.runtime) vars.runtimeVersion = entry.runtime->defaultVersion;
    return ProjectFile(m_options.idSource(), entry.mainFilePath,
                       ScaffoldCatalog::RenderMainFile(node.getFramework(), vars),
                       entry.primaryLanguage);
}

bool WorkspaceStore::ensureFilesLocked(Node& node) {
    if (!node.getFiles().empty()) return false;
    ProjectFile main = makeMainFile(node);
    FileId mainId = main.id;
    node.addFile(std::move(main));
    node.selectFile(mainId);
    return true;
}

void WorkspaceStore::flushFileSelectionLocked(const Node& node) {
    if (node.getSelectedFileId()) {
        m_coordinator->flushFile(node.getId(), *node.getSelectedFileId());
    }
}

void WorkspaceStore::flushSelectionLocked() {
    if (!m_selectedNodeId) return;
    if (const Node* node = findLocked(*m_selectedNodeId)) {
        flushFileSelectionLocked(*node);
    }
}

void WorkspaceStore::scheduleStructureLocked(const Node& node, const std::string& reason) {
    auto materializer = m_materializer;
    Node snapshot = node;
    m_coordinator->submitNodeJob(node.getId(), TaskType::Materialization, reason + " '" + node.getName() + "'",
        [materializer, snapshot](std::string& error) {
            return materializer->createProjectStructure(snapshot, error);
        });
}

void WorkspaceStore::publish(const Events& events) {
    if (events.empty()) return;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& entry : m_listeners) listeners.push_back(entry.second);
    }
    for (const auto& event : events) {
        for (const auto& listener : listeners) listener(event);
    }
}

// --- Nodes ---

NodeId WorkspaceStore::createNode(domain::NodeType type, domain::scaffold::Framework framework) {
    return createNodeImpl(type, framework, std::nullopt, std::nullopt);
}

NodeId WorkspaceStore::createNode(domain::NodeType type, domain::scaffold::Framework framework,
                                  const std::string& name, domain::Position position) {
    return createNodeImpl(type, framework, name, position);
}

NodeId WorkspaceStore::createNodeImpl(domain::NodeType type, domain::scaffold::Framework framework,
                                      std::optional<std::string> name, std::optional<domain::Position> position) {
    Events events;
    NodeId id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const float stagger = 200.0f + 50.0f * static_cast<float>(m_order.size());
        if (!name || name->empty()) name = "New Node " + std::to_string(m_order.size() + 1);
        if (!position) position = domain::Position{stagger, stagger};

        id = m_options.idSource();
        Node node(id, *name, type, framework, *position);
        ensureFilesLocked(node);

        node.assignProjectPath(m_materializer->projectRootFor(id));
        if (ScaffoldCatalog::Lookup(framework).needsEnvironment) {
            node.assignEnvironmentPath(m_materializer->environmentPathFor(id));
        }

        flushSelectionLocked();
        scheduleStructureLocked(node, "create project structure for");
        m_order.push_back(id);
        m_nodes.emplace(id, std::move(node));
        m_selectedNodeId = id;

        events.push_back({WorkspaceEventKind::NodeCreated, id, std::nullopt});
        events.push_back({WorkspaceEventKind::SelectionChanged, id, std::nullopt});
    }
    std::cout << "[WorkspaceStore] Created node " << id << std::endl;
    publish(events);
    return id;
}

bool WorkspaceStore::deleteNode(const NodeId& nodeId) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_nodes.find(nodeId);
        if (it == m_nodes.end()) return false;

        m_coordinator->cancelNode(nodeId);
        Node removed = std::move(it->second);
        m_nodes.erase(it);
        m_order.erase(std::remove(m_order.begin(), m_order.end(), nodeId), m_order.end());
        events.push_back({WorkspaceEventKind::NodeDeleted, nodeId, std::nullopt});

        for (auto& entry : m_nodes) {
            if (entry.second.disconnect(nodeId)) {
                events.push_back({WorkspaceEventKind::ConnectionsChanged, entry.first, std::nullopt});
            }
        }

        if (m_selectedNodeId == nodeId) {
            m_selectedNodeId.reset();
            events.push_back({WorkspaceEventKind::SelectionChanged, std::nullopt, std::nullopt});
        }

        if (m_options.deletionPolicy == DeletionPolicy::Purge) {
            auto materializer = m_materializer;
            m_coordinator->submitNodeJob(nodeId, TaskType::Purge, "purge project of '" + removed.getName() + "'",
                [materializer, removed](std::string& error) {
                    return materializer->removeProjectRoot(removed, error);
                });
        }
    }
    publish(events);
    return true;
}

bool WorkspaceStore::renameNode(const NodeId& nodeId, const std::string& name) {
    if (name.empty()) return false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node) return false;
        node->setName(name);
    }
    publish({{WorkspaceEventKind::NodeUpdated, nodeId, std::nullopt}});
    return true;
}

bool WorkspaceStore::moveNode(const NodeId& nodeId, domain::Position position) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node) return false;
        node->setPosition(position);
    }
    publish({{WorkspaceEventKind::NodeUpdated, nodeId, std::nullopt}});
    return true;
}

bool WorkspaceStore::changeFramework(const NodeId& nodeId, domain::scaffold::Framework framework) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node) return false;

        flushFileSelectionLocked(*node);
        node->setFramework(framework);

        const auto& entry = ScaffoldCatalog::Lookup(framework);
        FileId mainId;
        if (const ProjectFile* existing = node->findFileByPath(entry.mainFilePath)) {
            mainId = existing->id;
        } else {
            ProjectFile main = makeMainFile(*node);
            mainId = main.id;
            node->addFile(std::move(main));
            events.push_back({WorkspaceEventKind::FileAdded, nodeId, mainId});
        }
        node->selectFile(mainId);

        if (entry.needsEnvironment) {
            node->assignEnvironmentPath(m_materializer->environmentPathFor(nodeId));
        }
        scheduleStructureLocked(*node, "re-materialize");

        events.push_back({WorkspaceEventKind::NodeUpdated, nodeId, std::nullopt});
        events.push_back({WorkspaceEventKind::SelectionChanged, nodeId, mainId});
    }
    publish(events);
    return true;
}

// --- Selection ---

bool WorkspaceStore::selectNode(const NodeId& nodeId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!findLocked(nodeId)) return false;
        if (m_selectedNodeId == nodeId) return true;
        flushSelectionLocked();
        m_selectedNodeId = nodeId;
    }
    publish({{WorkspaceEventKind::SelectionChanged, nodeId, std::nullopt}});
    return true;
}

bool WorkspaceStore::selectFile(const NodeId& nodeId, const FileId& fileId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node || !node->findFile(fileId)) return false;
        if (m_selectedNodeId == nodeId && node->getSelectedFileId() == fileId) return true;

        flushSelectionLocked();
        if (m_selectedNodeId != nodeId) flushFileSelectionLocked(*node);
        node->selectFile(fileId);
        m_selectedNodeId = nodeId;
    }
    publish({{WorkspaceEventKind::SelectionChanged, nodeId, fileId}});
    return true;
}

void WorkspaceStore::clearSelection() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_selectedNodeId) return;
        flushSelectionLocked();
        m_selectedNodeId.reset();
    }
    publish({{WorkspaceEventKind::SelectionChanged, std::nullopt, std::nullopt}});
}

// --- Files ---

bool WorkspaceStore::updateFileContent(const NodeId& nodeId, const FileId& fileId, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node) return false;
        ProjectFile* file = node->findFile(fileId);
        if (!file) return false;
        // Unchanged content is still rescheduled so a failed write gets retried.
        const bool changed = file->content != content;
        file->content = content;
        m_coordinator->scheduleWrite(*node, *file);
        if (!changed) return true;
    }
    publish({{WorkspaceEventKind::FileContentChanged, nodeId, fileId}});
    return true;
}

RenameResult WorkspaceStore::renameFile(const NodeId& nodeId, const FileId& fileId, const std::string& newName) {
    RenameResult result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node || !node->findFile(fileId)) {
            result.outcome = RenameOutcome::NotFound;
            return result;
        }

        if (newName.empty() || newName == "." || newName == ".." ||
            newName.find_first_of("/\\") != std::string::npos) {
            result.outcome = RenameOutcome::Rejected;
            result.error = "invalid file name '" + newName + "'";
            return result;
        }

        ProjectFile* file = node->findFile(fileId);
        const std::string oldPath = file->path;
        const std::string oldName = file->name;
        const std::string newPath = ProjectFile::DirectoryOf(oldPath) + newName;
        if (newPath == oldPath) {
            result.outcome = RenameOutcome::Applied;
            return result;
        }
        if (node->findFileByPath(newPath)) {
            result.outcome = RenameOutcome::Rejected;
            result.error = "a file already exists at " + newPath;
            return result;
        }

        m_coordinator->flushFile(nodeId, fileId);
        node->moveFile(fileId, newPath);

        auto materializer = m_materializer;
        auto diskError = std::make_shared<std::string>();
        Node snapshot = *node;
        std::future<bool> done = m_coordinator->submitNodeJob(nodeId, TaskType::Rename,
            "rename " + oldPath + " -> " + newPath,
            [materializer, snapshot, oldPath, newPath, diskError](std::string& error) {
                bool ok = materializer->renameFile(snapshot, oldPath, newPath, error);
                if (!ok) *diskError = error;
                return ok;
            });

        file = node->findFile(fileId);
        if (!done.get()) {
            node->moveFile(fileId, oldPath);
            file->name = oldName;
            result.outcome = RenameOutcome::DiskFailure;
            result.error = diskError->empty() ? "rename failed on disk" : *diskError;
            std::cerr << "[WorkspaceStore] Rename rolled back: " << result.error << std::endl;
            return result;
        }

        if (auto language = domain::LanguageFromPath(newPath)) {
            file->language = *language;
        }
        result.outcome = RenameOutcome::Applied;
    }
    publish({{WorkspaceEventKind::FileRenamed, nodeId, fileId}});
    return result;
}

std::optional<FileId> WorkspaceStore::addFile(const NodeId& nodeId, const std::string& path,
                                              std::optional<domain::CodeLanguage> language) {
    if (!IsValidRelativePath(path)) return std::nullopt;

    FileId fileId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node || node->findFileByPath(path)) return std::nullopt;

        domain::CodeLanguage lang = language
            ? *language
            : domain::LanguageFromPath(path).value_or(domain::CodeLanguage::Scaffolding);
        ProjectFile file(m_options.idSource(), path, "", lang);
        fileId = file.id;
        if (!node->addFile(file)) return std::nullopt;

        flushFileSelectionLocked(*node);
        node->selectFile(fileId);

        auto materializer = m_materializer;
        Node snapshot = *node;
        m_coordinator->submitNodeJob(nodeId, TaskType::Materialization, "create " + path,
            [materializer, snapshot, file](std::string& error) {
                return materializer->saveFile(snapshot, file, error);
            });
    }
    publish({{WorkspaceEventKind::FileAdded, nodeId, fileId},
             {WorkspaceEventKind::SelectionChanged, nodeId, fileId}});
    return fileId;
}

bool WorkspaceStore::removeFile(const NodeId& nodeId, const FileId& fileId) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = findLocked(nodeId);
        if (!node) return false;
        const ProjectFile* existing = node->findFile(fileId);
        if (!existing) return false;

        m_coordinator->cancelFile(nodeId, fileId);
        ProjectFile removed = *existing;
        Node before = *node;
        node->removeFile(fileId);
        events.push_back({WorkspaceEventKind::FileRemoved, nodeId, fileId});

        auto materializer = m_materializer;
        m_coordinator->submitNodeJob(nodeId, TaskType::FileDeletion, "delete " + removed.path,
            [materializer, before, removed](std::string& error) {
                return materializer->deleteFile(before, removed, error);
            });

        if (ensureFilesLocked(*node)) {
            const ProjectFile& main = node->getFiles().front();
            Node snapshot = *node;
            ProjectFile mainCopy = main;
            m_coordinator->submitNodeJob(nodeId, TaskType::Materialization, "regenerate " + main.path,
                [materializer, snapshot, mainCopy](std::string& error) {
                    return materializer->saveFile(snapshot, mainCopy, error);
                });
            events.push_back({WorkspaceEventKind::FileAdded, nodeId, main.id});
        }
        events.push_back({WorkspaceEventKind::SelectionChanged, nodeId, node->getSelectedFileId()});
    }
    publish(events);
    return true;
}

// --- Connections ---

bool WorkspaceStore::connect(const NodeId& fromId, const NodeId& toId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (fromId == toId) return false;
        Node* from = findLocked(fromId);
        if (!from || !findLocked(toId)) return false;
        if (!from->connect(toId)) return true;
    }
    publish({{WorkspaceEventKind::ConnectionsChanged, fromId, std::nullopt}});
    return true;
}

bool WorkspaceStore::disconnect(const NodeId& fromId, const NodeId& toId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* from = findLocked(fromId);
        if (!from || !from->disconnect(toId)) return false;
    }
    publish({{WorkspaceEventKind::ConnectionsChanged, fromId, std::nullopt}});
    return true;
}

// --- Canvas ---

void WorkspaceStore::setCanvasOffset(domain::Position offset) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_canvas.offset = offset;
    }
    publish({{WorkspaceEventKind::CanvasChanged, std::nullopt, std::nullopt}});
}

void WorkspaceStore::panCanvas(float dx, float dy) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_canvas.offset.x += dx;
        m_canvas.offset.y += dy;
    }
    publish({{WorkspaceEventKind::CanvasChanged, std::nullopt, std::nullopt}});
}

void WorkspaceStore::setCanvasScale(float scale) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_canvas.scale = domain::CanvasTransform::ClampScale(scale);
    }
    publish({{WorkspaceEventKind::CanvasChanged, std::nullopt, std::nullopt}});
}

void WorkspaceStore::resetCanvas() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_canvas = domain::CanvasTransform{};
    }
    publish({{WorkspaceEventKind::CanvasChanged, std::nullopt, std::nullopt}});
}

// --- Accessors ---

std::optional<Node> WorkspaceStore::getNode(const NodeId& nodeId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Node* node = findLocked(nodeId);
    if (!node) return std::nullopt;
    return *node;
}

std::optional<ProjectFile> WorkspaceStore::getFile(const NodeId& nodeId, const FileId& fileId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Node* node = findLocked(nodeId);
    if (!node) return std::nullopt;
    const ProjectFile* file = node->findFile(fileId);
    if (!file) return std::nullopt;
    return *file;
}

std::vector<NodeId> WorkspaceStore::nodeIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order;
}

std::size_t WorkspaceStore::nodeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order.size();
}

std::optional<NodeId> WorkspaceStore::selectedNodeId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_selectedNodeId;
}

std::optional<ProjectFile> WorkspaceStore::selectedFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_selectedNodeId) return std::nullopt;
    const Node* node = findLocked(*m_selectedNodeId);
    if (!node || !node->getSelectedFileId()) return std::nullopt;
    const ProjectFile* file = node->findFile(*node->getSelectedFileId());
    if (!file) return std::nullopt;
    return *file;
}

domain::CanvasTransform WorkspaceStore::canvas() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_canvas;
}

std::string WorkspaceStore::workspaceName() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_name;
}

domain::WorkspaceDocument WorkspaceStore::snapshotLocked() const {
    domain::WorkspaceDocument doc;
    doc.name = m_name;
    doc.createdMs = m_createdMs;
    doc.modifiedMs = NowMs();
    doc.canvas = m_canvas;
    doc.selectedNodeId = m_selectedNodeId;
    doc.nodes.reserve(m_order.size());
    for (const auto& id : m_order) {
        doc.nodes.push_back(m_nodes.at(id));
    }
    return doc;
}

domain::WorkspaceDocument WorkspaceStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return snapshotLocked();
}

// --- Documents ---

domain::WorkspaceDocument WorkspaceStore::exportDocument() {
    m_coordinator->flushAll();
    std::lock_guard<std::mutex> lock(m_mutex);
    return snapshotLocked();
}

void WorkspaceStore::resetLocked(const std::string& name) {
    m_nodes.clear();
    m_order.clear();
    m_selectedNodeId.reset();
    m_canvas = domain::CanvasTransform{};
    m_name = name.empty() ? domain::WorkspaceDocument{}.name : name;
    m_createdMs = NowMs();
}

void WorkspaceStore::loadDocument(domain::WorkspaceDocument doc) {
    m_coordinator->flushAll();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        resetLocked(doc.name);
        if (doc.createdMs > 0) m_createdMs = doc.createdMs;
        m_canvas.offset = doc.canvas.offset;
        m_canvas.scale = domain::CanvasTransform::ClampScale(doc.canvas.scale);

        for (auto& node : doc.nodes) {
            const NodeId id = node.getId();
            if (id.empty() || m_nodes.count(id)) {
                std::cerr << "[WorkspaceStore] Skipping node with duplicate or empty id '" << id << "'" << std::endl;
                continue;
            }

            node.normalize();
            std::vector<FileId> unsafe;
            for (const auto& file : node.getFiles()) {
                if (!IsValidRelativePath(file.path)) unsafe.push_back(file.id);
            }
            for (const auto& fileId : unsafe) {
                std::cerr << "[WorkspaceStore] Dropping file with unsafe path from node " << id << std::endl;
                node.removeFile(fileId);
            }
            if (ensureFilesLocked(node)) {
                std::cerr << "[WorkspaceStore] Node " << id << " had no files; regenerated main file" << std::endl;
            }
            if (node.getName().empty()) node.setName("New Node " + std::to_string(m_order.size() + 1));

            // Roots are always derived from the id: a document cannot point two nodes
            // at one directory, nor a node outside the projects base.
            const std::string root = m_materializer->projectRootFor(id);
            if (node.getProjectPath() && *node.getProjectPath() != root) {
                std::cerr << "[WorkspaceStore] Ignoring stored project path '" << *node.getProjectPath()
                          << "' of node " << id << std::endl;
            }
            node.clearStoragePaths();
            node.assignProjectPath(root);
            if (ScaffoldCatalog::Lookup(node.getFramework()).needsEnvironment) {
                node.assignEnvironmentPath(m_materializer->environmentPathFor(id));
            }

            m_order.push_back(id);
            m_nodes.emplace(id, std::move(node));
        }

        for (auto& entry : m_nodes) {
            const std::vector<NodeId> targets = entry.second.getConnections();
            for (const auto& target : targets) {
                if (!m_nodes.count(target)) entry.second.disconnect(target);
            }
        }

        if (doc.selectedNodeId && m_nodes.count(*doc.selectedNodeId)) {
            m_selectedNodeId = doc.selectedNodeId;
        }

        for (const auto& id : m_order) {
            scheduleStructureLocked(m_nodes.at(id), "re-materialize");
        }
        std::cout << "[WorkspaceStore] Loaded workspace '" << m_name << "' with "
                  << m_order.size() << " node(s)" << std::endl;
    }
    publish({{WorkspaceEventKind::WorkspaceReplaced, std::nullopt, std::nullopt}});
}

void WorkspaceStore::newWorkspace(const std::string& name) {
    m_coordinator->flushAll();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        resetLocked(name);
    }
    publish({{WorkspaceEventKind::WorkspaceReplaced, std::nullopt, std::nullopt}});
}

// --- Misc ---

std::optional<ContextBundle> WorkspaceStore::buildContext(const NodeId& nodeId, std::size_t prefixChars) const {
    std::optional<Node> current;
    std::vector<Node> connected;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const Node* node = findLocked(nodeId);
        if (!node) return std::nullopt;
        current = *node;
        for (const auto& target : node->getConnections()) {
            if (const Node* other = findLocked(target)) connected.push_back(*other);
        }
    }
    ContextAssembler assembler(prefixChars == 0 ? m_options.contextPrefixChars : prefixChars);
    return assembler.assemble(*current, connected);
}

void WorkspaceStore::flushAll() {
    m_coordinator->flushAll();
}

std::size_t WorkspaceStore::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    std::size_t token = m_nextToken++;
    m_listeners.emplace(token, std::move(listener));
    return token;
}

void WorkspaceStore::unsubscribe(std::size_t token) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.erase(token);
}

} // namespace pioneer::application
