/**
 * @file Node.cpp
 * @brief Implementation of the Node aggregate.
 */

#include "domain/Node.hpp"

#include <algorithm>
#include <unordered_set>

#include "domain/scaffold/ScaffoldCatalog.hpp"

namespace pioneer::domain {

Node::Node(NodeId id, std::string name, NodeType type, scaffold::Framework framework, Position position)
    : m_id(std::move(id)),
      m_name(std::move(name)),
      m_type(type),
      m_framework(framework),
      m_language(scaffold::ScaffoldCatalog::Lookup(framework).primaryLanguage),
      m_position(position) {}

void Node::setFramework(scaffold::Framework framework) {
    m_framework = framework;
    m_language = scaffold::ScaffoldCatalog::Lookup(framework).primaryLanguage;
}

bool Node::assignProjectPath(const std::string& path) {
    if (m_projectPath || path.empty()) return false;
    m_projectPath = path;
    return true;
}

bool Node::assignEnvironmentPath(const std::string& path) {
    if (m_environmentPath || path.empty()) return false;
    m_environmentPath = path;
    return true;
}

const ProjectFile* Node::findFile(const FileId& fileId) const {
    auto it = std::find_if(m_files.begin(), m_files.end(),
        [&](const ProjectFile& f) { return f.id == fileId; });
    return it == m_files.end() ? nullptr : &*it;
}

ProjectFile* Node::findFile(const FileId& fileId) {
    auto it = std::find_if(m_files.begin(), m_files.end(),
        [&](const ProjectFile& f) { return f.id == fileId; });
    return it == m_files.end() ? nullptr : &*it;
}

const ProjectFile* Node::findFileByPath(const std::string& path) const {
    auto it = std::find_if(m_files.begin(), m_files.end(),
        [&](const ProjectFile& f) { return f.path == path; });
    return it == m_files.end() ? nullptr : &*it;
}

const ProjectFile* Node::mainFile() const {
    const auto& mainPath = scaffold::ScaffoldCatalog::Lookup(m_framework).mainFilePath;
    if (const ProjectFile* f = findFileByPath(mainPath)) return f;
    return m_files.empty() ? nullptr : &m_files.front();
}

bool Node::addFile(ProjectFile file) {
    if (file.id.empty() || file.path.empty()) return false;
    if (findFile(file.id) || findFileByPath(file.path)) return false;
    m_files.push_back(std::move(file));
    return true;
}

bool Node::removeFile(const FileId& fileId) {
    auto it = std::find_if(m_files.begin(), m_files.end(),
        [&](const ProjectFile& f) { return f.id == fileId; });
    if (it == m_files.end()) return false;
    m_files.erase(it);

    if (m_selectedFileId && *m_selectedFileId == fileId) {
        if (m_files.empty()) {
            m_selectedFileId.reset();
        } else {
            m_selectedFileId = m_files.front().id;
        }
    }
    return true;
}

bool Node::moveFile(const FileId& fileId, const std::string& newPath) {
    ProjectFile* file = findFile(fileId);
    if (!file || newPath.empty()) return false;
    const ProjectFile* other = findFileByPath(newPath);
    if (other && other->id != fileId) return false;
    file->path = newPath;
    file->name = ProjectFile::NameFromPath(newPath);
    return true;
}

bool Node::selectFile(const FileId& fileId) {
    if (!findFile(fileId)) return false;
    m_selectedFileId = fileId;
    return true;
}

bool Node::connect(const NodeId& target) {
    if (target.empty() || target == m_id || isConnectedTo(target)) return false;
    m_connections.push_back(target);
    return true;
}

bool Node::disconnect(const NodeId& target) {
    auto it = std::find(m_connections.begin(), m_connections.end(), target);
    if (it == m_connections.end()) return false;
    m_connections.erase(it);
    return true;
}

bool Node::isConnectedTo(const NodeId& target) const {
    return std::find(m_connections.begin(), m_connections.end(), target) != m_connections.end();
}

void Node::normalize() {
    std::unordered_set<std::string> ids;
    std::unordered_set<std::string> paths;
    std::vector<ProjectFile> kept;
    kept.reserve(m_files.size());
    for (auto& file : m_files) {
        if (file.id.empty() || file.path.empty()) continue;
        if (!ids.insert(file.id).second || !paths.insert(file.path).second) continue;
        if (file.name.empty()) file.name = ProjectFile::NameFromPath(file.path);
        kept.push_back(std::move(file));
    }
    m_files = std::move(kept);

    if (m_selectedFileId && !findFile(*m_selectedFileId)) {
        m_selectedFileId.reset();
    }

    std::vector<NodeId> connections;
    for (const auto& target : m_connections) {
        if (target.empty() || target == m_id) continue;
        if (std::find(connections.begin(), connections.end(), target) != connections.end()) continue;
        connections.push_back(target);
    }
    m_connections = std::move(connections);
}

bool Node::checkInvariants() const {
    if (m_files.empty()) return false;
    if (m_selectedFileId && !findFile(*m_selectedFileId)) return false;
    if (isConnectedTo(m_id)) return false;

    std::unordered_set<std::string> ids;
    std::unordered_set<std::string> paths;
    for (const auto& file : m_files) {
        if (!ids.insert(file.id).second) return false;
        if (!paths.insert(file.path).second) return false;
    }
    return true;
}

} // namespace pioneer::domain
