/**
 * @file FsProjectMaterializer.cpp
 * @brief Implementation of FsProjectMaterializer.
 */

#include "infrastructure/FsProjectMaterializer.hpp"

#include <iostream>
#include <system_error>
#include <vector>

#include "domain/scaffold/ScaffoldCatalog.hpp"
#include "infrastructure/AtomicFileWriter.hpp"

namespace pioneer::infrastructure {

namespace fs = std::filesystem;
using domain::scaffold::ScaffoldCatalog;

FsProjectMaterializer::FsProjectMaterializer(std::string basePath,
                                             std::string environmentsPath,
                                             std::shared_ptr<domain::RuntimeProbe> probe,
                                             std::string workspaceNamespace)
    : m_basePath(std::move(basePath)),
      m_environmentsPath(std::move(environmentsPath)),
      m_probe(std::move(probe)),
      m_namespace(ScaffoldCatalog::Slugify(workspaceNamespace)) {
    if (workspaceNamespace.empty()) m_namespace.clear();
}

std::string FsProjectMaterializer::projectRootFor(const domain::NodeId& nodeId) const {
    fs::path root = m_basePath;
    if (!m_namespace.empty()) root /= m_namespace;
    return (root / nodeId).string();
}

std::string FsProjectMaterializer::environmentPathFor(const domain::NodeId& nodeId) const {
    return (fs::path(m_environmentsPath) / nodeId).string();
}

fs::path FsProjectMaterializer::rootOf(const domain::Node& node) const {
    if (node.getProjectPath()) return fs::path(*node.getProjectPath());
    return fs::path(projectRootFor(node.getId()));
}

bool FsProjectMaterializer::ResolveInside(const fs::path& root, const std::string& relPath,
                                          fs::path& out, std::string& error) {
    fs::path rel(relPath);
    if (relPath.empty() || rel.is_absolute()) {
        error = "invalid relative path '" + relPath + "'";
        return false;
    }
    fs::path normal = rel.lexically_normal();
    if (normal.empty() || *normal.begin() == "..") {
        error = "path escapes the project root: '" + relPath + "'";
        return false;
    }
    out = root / normal;
    return true;
}

std::string FsProjectMaterializer::resolveRuntimeVersion(const domain::Node& node) {
    const auto& entry = ScaffoldCatalog::Lookup(node.getFramework());
    if (!entry.runtime) return "";
    if (m_probe) {
        if (auto detected = m_probe->detectVersion(*entry.runtime)) return *detected;
    }
    return entry.runtime->defaultVersion;
}

bool FsProjectMaterializer::createProjectStructure(const domain::Node& node, std::string& error) {
    const auto& entry = ScaffoldCatalog::Lookup(node.getFramework());
    const fs::path root = rootOf(node);

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        error = "cannot create project root " + root.string() + ": " + ec.message();
        std::cerr << "[FsProjectMaterializer] " << error << std::endl;
        return false;
    }

    for (const auto& dir : entry.directories) {
        fs::path target;
        if (!ResolveInside(root, dir, target, error)) return false;
        fs::create_directories(target, ec);
        if (ec) {
            error = "cannot create directory " + target.string() + ": " + ec.message();
            std::cerr << "[FsProjectMaterializer] " << error << std::endl;
            return false;
        }
    }

    domain::scaffold::TemplateVars vars;
    vars.name = node.getName();
    vars.typeLabel = domain::NodeTypeDisplayName(node.getType());
    if (entry.runtime) vars.runtimeVersion = resolveRuntimeVersion(node);

    // Manifest and seeds are written once; user edits to them are never clobbered.
    std::vector<const domain::scaffold::TemplateFile*> onceFiles;
    if (entry.manifest) onceFiles.push_back(&*entry.manifest);
    for (const auto& seed : entry.seedFiles) onceFiles.push_back(&seed);

    for (const auto* tpl : onceFiles) {
        if (node.findFileByPath(tpl->path)) continue;
        fs::path target;
        if (!ResolveInside(root, tpl->path, target, error)) return false;
        if (fs::exists(target, ec)) continue;
        if (!AtomicFileWriter::Write(target, ScaffoldCatalog::RenderTemplate(tpl->templateText, vars), error)) {
            std::cerr << "[FsProjectMaterializer] " << error << std::endl;
            return false;
        }
    }

    for (const auto& file : node.getFiles()) {
        fs::path target;
        if (!ResolveInside(root, file.path, target, error)) return false;
        if (!AtomicFileWriter::Write(target, file.content, error)) {
            std::cerr << "[FsProjectMaterializer] " << error << std::endl;
            return false;
        }
    }

    std::cout << "[FsProjectMaterializer] Materialized " << entry.displayName
              << " project at " << root.string() << std::endl;
    return true;
}

bool FsProjectMaterializer::saveFile(const domain::Node& node, const domain::ProjectFile& file, std::string& error) {
    fs::path target;
    if (!ResolveInside(rootOf(node), file.path, target, error)) return false;
    if (!AtomicFileWriter::Write(target, file.content, error)) {
        std::cerr << "[FsProjectMaterializer] " << error << std::endl;
        return false;
    }
    return true;
}

bool FsProjectMaterializer::deleteFile(const domain::Node& node, const domain::ProjectFile& file, std::string& error) {
    fs::path target;
    if (!ResolveInside(rootOf(node), file.path, target, error)) return false;

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        error = "refusing to delete directory " + target.string();
        return false;
    }
    fs::remove(target, ec);
    if (ec) {
        error = "cannot delete " + target.string() + ": " + ec.message();
        std::cerr << "[FsProjectMaterializer] " << error << std::endl;
        return false;
    }
    return true;
}

bool FsProjectMaterializer::renameFile(const domain::Node& node, const std::string& oldPath,
                                       const std::string& newPath, std::string& error) {
    const fs::path root = rootOf(node);
    fs::path source;
    fs::path target;
    if (!ResolveInside(root, oldPath, source, error)) return false;
    if (!ResolveInside(root, newPath, target, error)) return false;
    if (source == target) return true;

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        error = "target is a directory: " + target.string();
        std::cerr << "[FsProjectMaterializer] " << error << std::endl;
        return false;
    }
    // Unlisted files (edited seeds, user notes) are never replaced.
    if (fs::exists(target, ec) && !(fs::exists(source, ec) && fs::equivalent(source, target, ec))) {
        error = "target already exists: " + target.string();
        std::cerr << "[FsProjectMaterializer] " << error << std::endl;
        return false;
    }

    if (!fs::exists(source, ec)) {
        // Never written yet: materialize the in-memory content at the new location.
        const domain::ProjectFile* file = node.findFileByPath(oldPath);
        if (!file) file = node.findFileByPath(newPath);
        if (!file) {
            error = "source file not found: " + source.string();
            return false;
        }
        if (!AtomicFileWriter::Write(target, file->content, error)) {
            std::cerr << "[FsProjectMaterializer] " << error << std::endl;
            return false;
        }
        return true;
    }

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + target.parent_path().string() + ": " + ec.message();
            std::cerr << "[FsProjectMaterializer] " << error << std::endl;
            return false;
        }
    }

    fs::rename(source, target, ec);
    if (ec) {
        error = "rename " + source.string() + " -> " + target.string() + " failed: " + ec.message();
        std::cerr << "[FsProjectMaterializer] " << error << std::endl;
        return false;
    }
    return true;
}

bool FsProjectMaterializer::removeProjectRoot(const domain::Node& node, std::string& error) {
    const fs::path root = rootOf(node);
    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec) {
        error = "cannot remove " + root.string() + ": " + ec.message();
        std::cerr << "[FsProjectMaterializer] " << error << std::endl;
        return false;
    }

    const auto& entry = ScaffoldCatalog::Lookup(node.getFramework());
    if (entry.needsEnvironment && node.getEnvironmentPath()) {
        fs::remove_all(*node.getEnvironmentPath(), ec);
        if (ec) {
            std::cerr << "[FsProjectMaterializer] Could not remove environment "
                      << *node.getEnvironmentPath() << ": " << ec.message() << std::endl;
        }
    }
    std::cout << "[FsProjectMaterializer] Purged " << root.string() << std::endl;
    return true;
}

} // namespace pioneer::infrastructure
