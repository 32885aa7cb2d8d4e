/**
 * @file FsProjectMaterializer.hpp
 * @brief Filesystem-based implementation of the ProjectMaterializer.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "domain/ProjectMaterializer.hpp"
#include "domain/RuntimeProbe.hpp"

namespace pioneer::infrastructure {

/**
 * @class FsProjectMaterializer
 * @brief Lays out each node under <base>/<node-id> (or <base>/<workspace>/<node-id>).
 */
class FsProjectMaterializer : public domain::ProjectMaterializer {
public:
    /**
     * @param basePath Root for all project directories (validated beforehand).
     * @param environmentsPath Root for isolated runtime environments.
     * @param probe Optional runtime probe; null means catalog defaults are used.
     * @param workspaceNamespace When non-empty, roots are nested under this folder.
     */
    FsProjectMaterializer(std::string basePath,
                          std::string environmentsPath,
                          std::shared_ptr<domain::RuntimeProbe> probe,
                          std::string workspaceNamespace = "");

    std::string projectRootFor(const domain::NodeId& nodeId) const override;
    std::string environmentPathFor(const domain::NodeId& nodeId) const override;

    bool createProjectStructure(const domain::Node& node, std::string& error) override;
    bool saveFile(const domain::Node& node, const domain::ProjectFile& file, std::string& error) override;
    bool deleteFile(const domain::Node& node, const domain::ProjectFile& file, std::string& error) override;
    bool renameFile(const domain::Node& node, const std::string& oldPath,
                    const std::string& newPath, std::string& error) override;
    bool removeProjectRoot(const domain::Node& node, std::string& error) override;

private:
    std::filesystem::path rootOf(const domain::Node& node) const;

    /** @brief Resolves a relative path under root; rejects absolute and escaping paths. */
    static bool ResolveInside(const std::filesystem::path& root, const std::string& relPath,
                              std::filesystem::path& out, std::string& error);

    std::string resolveRuntimeVersion(const domain::Node& node);

    std::string m_basePath;
    std::string m_environmentsPath;
    std::shared_ptr<domain::RuntimeProbe> m_probe;
    std::string m_namespace;
};

} // namespace pioneer::infrastructure
