/**
 * @file PioneerApp.cpp
 * @brief Implementation of the PioneerApp class.
 */
#include "app/PioneerApp.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

#include "domain/scaffold/ScaffoldCatalog.hpp"
#include "infrastructure/FsProjectMaterializer.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ShellRuntimeProbe.hpp"
#include "infrastructure/WorkspaceJson.hpp"

namespace pioneer::app {

namespace {

std::optional<domain::NodeType> ParseNodeType(const std::string& value) {
    if (value == "macos" || value == "macos_app") return domain::NodeType::MacOSApp;
    if (value == "iphone" || value == "iphone_app") return domain::NodeType::IPhoneApp;
    if (value == "website") return domain::NodeType::Website;
    if (value == "cloud" || value == "cloud_backend") return domain::NodeType::CloudBackend;
    if (value == "custom") return domain::NodeType::Custom;
    return std::nullopt;
}

} // namespace

bool PioneerApp::Init(const std::string& workspaceName) {
    std::string error;
    if (!infrastructure::ConfigLoader::ValidateBasePath(m_settings.projectsBasePath, error)) {
        std::cerr << "[PioneerApp] Projects base path unusable: " << error << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    m_services.runtimeProbe = std::make_shared<infrastructure::ShellRuntimeProbe>();
    m_services.materializer = std::make_shared<infrastructure::FsProjectMaterializer>(
        m_settings.projectsBasePath,
        infrastructure::PathUtils::GetEnvironmentsDir().string(),
        m_services.runtimeProbe,
        m_settings.namespaceByWorkspace ? workspaceName : std::string());
    m_services.persistence = std::make_shared<application::PersistenceCoordinator>(
        m_services.materializer,
        static_cast<std::size_t>(m_settings.ioLanes),
        std::chrono::milliseconds(m_settings.debounceMs));

    application::WorkspaceStore::Options options;
    options.deletionPolicy = application::DeletionPolicyFromString(m_settings.deletionPolicy);
    options.contextPrefixChars = m_settings.contextPrefixChars;
    options.workspaceName = workspaceName;
    m_services.workspace = std::make_unique<application::WorkspaceStore>(
        m_services.materializer, m_services.persistence, options);
    return true;
}

void PioneerApp::Shutdown() {
    if (m_services.workspace) {
        m_services.workspace->flushAll();
    }
    if (m_services.persistence) {
        m_services.persistence->stop();
        if (m_services.persistence->failureCount() > 0) {
            std::cerr << "[PioneerApp] " << m_services.persistence->failureCount()
                      << " disk operation(s) failed; see log above." << std::endl;
        }
    }
}

bool PioneerApp::OpenWorkspace(const std::string& path) {
    std::string error;
    auto doc = infrastructure::WorkspaceJson::LoadFromFile(path, error);
    if (!doc) {
        std::cerr << "[PioneerApp] Cannot open workspace " << path << ": " << error << std::endl;
        return false;
    }
    if (!Init(doc->name)) return false;
    m_services.workspace->loadDocument(std::move(*doc));
    return true;
}

bool PioneerApp::SaveWorkspace(const std::string& path) {
    std::string error;
    if (!infrastructure::WorkspaceJson::SaveToFile(path, m_services.workspace->exportDocument(), error)) {
        std::cerr << "[PioneerApp] Cannot save workspace " << path << ": " << error << std::endl;
        return false;
    }
    std::cout << "[PioneerApp] Saved " << path << std::endl;
    return true;
}

int PioneerApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    m_settingsDir = infrastructure::PathUtils::GetSettingsDir().string();
    if (args.size() >= 2 && args[0] == "--settings") {
        m_settingsDir = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    m_settings = infrastructure::ConfigLoader::Load(m_settingsDir);

    if (args.empty()) {
        PrintUsage();
        return 1;
    }

    const std::string command = args.front();
    args.erase(args.begin());

    int code = 1;
    if (command == "new") code = CmdNew(args);
    else if (command == "add-node") code = CmdAddNode(args);
    else if (command == "delete-node") code = CmdDeleteNode(args);
    else if (command == "connect") code = CmdConnect(args);
    else if (command == "add-file") code = CmdAddFile(args);
    else if (command == "materialize") code = CmdMaterialize(args);
    else if (command == "list") code = CmdList(args);
    else if (command == "context") code = CmdContext(args);
    else if (command == "frameworks") code = CmdFrameworks();
    else if (command == "set-base-path") code = CmdSetBasePath(args);
    else {
        std::cerr << "Unknown command: " << command << std::endl;
        PrintUsage();
    }

    Shutdown();
    return code;
}

void PioneerApp::PrintUsage() {
    std::cout << "Usage: pioneer [--settings <dir>] <command> [args]\n"
              << "  new <workspace.json> [name]\n"
              << "  add-node <workspace.json> <macos|iphone|website|cloud|custom> <framework> [name]\n"
              << "  delete-node <workspace.json> <node-id>\n"
              << "  connect <workspace.json> <from-id> <to-id>\n"
              << "  add-file <workspace.json> <node-id> <relative-path>\n"
              << "  materialize <workspace.json>\n"
              << "  list <workspace.json>\n"
              << "  context <workspace.json> <node-id>\n"
              << "  frameworks\n"
              << "  set-base-path <dir>\n";
}

int PioneerApp::CmdNew(const std::vector<std::string>& args) {
    if (args.empty()) { PrintUsage(); return 1; }
    const std::string name = args.size() > 1 ? args[1] : "Untitled Project";
    if (!Init(name)) return 1;

    m_services.workspace->createNode(domain::NodeType::IPhoneApp, domain::scaffold::Framework::Swift,
                                     "Example iPhone App", domain::Position{200.0f, 200.0f});
    return SaveWorkspace(args[0]) ? 0 : 1;
}

int PioneerApp::CmdAddNode(const std::vector<std::string>& args) {
    if (args.size() < 3) { PrintUsage(); return 1; }
    auto type = ParseNodeType(args[1]);
    if (!type) {
        std::cerr << "Unknown node type: " << args[1] << std::endl;
        return 1;
    }
    auto framework = domain::scaffold::ScaffoldCatalog::FrameworkFromKey(args[2]);
    if (!framework) {
        std::cerr << "Unknown framework: " << args[2] << " (see 'pioneer frameworks')" << std::endl;
        return 1;
    }
    if (!OpenWorkspace(args[0])) return 1;

    domain::NodeId id;
    if (args.size() > 3) {
        const float stagger = 200.0f + 50.0f * static_cast<float>(m_services.workspace->nodeCount());
        id = m_services.workspace->createNode(*type, *framework, args[3], domain::Position{stagger, stagger});
    } else {
        id = m_services.workspace->createNode(*type, *framework);
    }
    std::cout << id << std::endl;
    return SaveWorkspace(args[0]) ? 0 : 1;
}

int PioneerApp::CmdDeleteNode(const std::vector<std::string>& args) {
    if (args.size() < 2) { PrintUsage(); return 1; }
    if (!OpenWorkspace(args[0])) return 1;
    if (!m_services.workspace->deleteNode(args[1])) {
        std::cerr << "No node with id " << args[1] << std::endl;
        return 1;
    }
    return SaveWorkspace(args[0]) ? 0 : 1;
}

int PioneerApp::CmdConnect(const std::vector<std::string>& args) {
    if (args.size() < 3) { PrintUsage(); return 1; }
    if (!OpenWorkspace(args[0])) return 1;
    if (!m_services.workspace->connect(args[1], args[2])) {
        std::cerr << "Cannot connect " << args[1] << " -> " << args[2] << std::endl;
        return 1;
    }
    return SaveWorkspace(args[0]) ? 0 : 1;
}

int PioneerApp::CmdAddFile(const std::vector<std::string>& args) {
    if (args.size() < 3) { PrintUsage(); return 1; }
    if (!OpenWorkspace(args[0])) return 1;
    auto fileId = m_services.workspace->addFile(args[1], args[2]);
    if (!fileId) {
        std::cerr << "Cannot add " << args[2] << " to node " << args[1] << std::endl;
        return 1;
    }
    std::cout << *fileId << std::endl;
    return SaveWorkspace(args[0]) ? 0 : 1;
}

int PioneerApp::CmdMaterialize(const std::vector<std::string>& args) {
    if (args.empty()) { PrintUsage(); return 1; }
    if (!OpenWorkspace(args[0])) return 1;
    m_services.workspace->flushAll();
    return m_services.persistence->failureCount() == 0 ? 0 : 1;
}

int PioneerApp::CmdList(const std::vector<std::string>& args) {
    if (args.empty()) { PrintUsage(); return 1; }
    if (!OpenWorkspace(args[0])) return 1;

    const auto doc = m_services.workspace->snapshot();
    std::cout << doc.name << " (" << doc.nodes.size() << " nodes)\n";
    for (const auto& node : doc.nodes) {
        const bool selected = doc.selectedNodeId && *doc.selectedNodeId == node.getId();
        std::cout << (selected ? "* " : "  ") << node.getId() << "  " << node.getName()
                  << "  [" << domain::NodeTypeDisplayName(node.getType()) << ", "
                  << domain::scaffold::ScaffoldCatalog::Lookup(node.getFramework()).displayName << "]\n";
        for (const auto& file : node.getFiles()) {
            std::cout << "      " << file.path << "\n";
        }
        for (const auto& target : node.getConnections()) {
            std::cout << "      -> " << target << "\n";
        }
        if (node.getProjectPath()) {
            std::cout << "      @ " << *node.getProjectPath() << "\n";
        }
    }
    return 0;
}

int PioneerApp::CmdContext(const std::vector<std::string>& args) {
    if (args.size() < 2) { PrintUsage(); return 1; }
    if (!OpenWorkspace(args[0])) return 1;
    auto bundle = m_services.workspace->buildContext(args[1]);
    if (!bundle) {
        std::cerr << "No node with id " << args[1] << std::endl;
        return 1;
    }
    std::cout << bundle->render();
    return 0;
}

int PioneerApp::CmdFrameworks() {
    for (const auto& entry : domain::scaffold::ScaffoldCatalog::All()) {
        std::cout << entry.key << "\t" << entry.displayName << "\t"
                  << domain::LanguageDisplayName(entry.primaryLanguage) << "\t" << entry.mainFilePath << "\n";
    }
    return 0;
}

int PioneerApp::CmdSetBasePath(const std::vector<std::string>& args) {
    if (args.empty()) { PrintUsage(); return 1; }
    std::string error;
    if (!infrastructure::ConfigLoader::SetProjectsBasePath(m_settingsDir, m_settings, args[0], error)) {
        std::cerr << "[PioneerApp] " << error << std::endl;
        return 1;
    }
    std::cout << "[PioneerApp] Projects base path set to " << m_settings.projectsBasePath << std::endl;
    return 0;
}

} // namespace pioneer::app
