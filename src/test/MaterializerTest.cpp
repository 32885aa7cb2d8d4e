#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>

#include "domain/scaffold/ScaffoldCatalog.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FsProjectMaterializer.hpp"

using namespace pioneer;
using namespace pioneer::domain;
namespace fs = std::filesystem;

namespace {

class FixedRuntimeProbe : public RuntimeProbe {
public:
    explicit FixedRuntimeProbe(std::optional<std::string> version) : m_version(std::move(version)) {}
    std::optional<std::string> detectVersion(const scaffold::RuntimeSpec&) override {
        ++calls;
        return m_version;
    }
    int calls = 0;

private:
    std::optional<std::string> m_version;
};

std::set<std::string> ListTree(const fs::path& root) {
    std::set<std::string> entries;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        entries.insert(fs::relative(entry.path(), root).generic_string());
    }
    return entries;
}

std::string ReadAll(const fs::path& path) {
    std::string content;
    bool ok = infrastructure::AtomicFileWriter::Read(path, content);
    assert(ok && "File should be readable.");
    return content;
}

Node MakeNode(const std::string& id, scaffold::Framework framework, const std::string& name) {
    Node node(id, name, NodeType::Website, framework);
    const auto& entry = scaffold::ScaffoldCatalog::Lookup(framework);
    scaffold::TemplateVars vars{name, "Website", ""};
    node.addFile(ProjectFile(id + "-main", entry.mainFilePath,
                             scaffold::ScaffoldCatalog::RenderMainFile(framework, vars), entry.primaryLanguage));
    return node;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Materializer Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "pioneer_materializer_test";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    auto probe = std::make_shared<FixedRuntimeProbe>("21.6.1");
    infrastructure::FsProjectMaterializer materializer(
        (testRoot / "projects").string(), (testRoot / "envs").string(), probe);

    assert(materializer.projectRootFor("abc") == (testRoot / "projects" / "abc").string());
    assert(materializer.environmentPathFor("abc") == (testRoot / "envs" / "abc").string());

    infrastructure::FsProjectMaterializer namespaced(
        (testRoot / "projects").string(), (testRoot / "envs").string(), nullptr, "My Workspace");
    assert(namespaced.projectRootFor("abc") == (testRoot / "projects" / "my-workspace" / "abc").string());
    std::cout << "[PASS] Project roots are derived from ids." << std::endl;

    // Python: scaffold, seeds, main file.
    Node py = MakeNode("py1", scaffold::Framework::PurePy, "Data Tool");
    std::string error;
    assert(materializer.createProjectStructure(py, error));
    fs::path pyRoot = materializer.projectRootFor("py1");
    assert(fs::is_directory(pyRoot / "src"));
    assert(fs::is_directory(pyRoot / "tests"));
    assert(fs::is_directory(pyRoot / "docs"));
    assert(fs::exists(pyRoot / "src" / "main.py"));
    assert(fs::exists(pyRoot / "src" / "__init__.py"));
    assert(ReadAll(pyRoot / "README.md").find("# Data Tool") != std::string::npos);
    assert(!fs::exists(pyRoot / "requirements.txt"));

    // Idempotent: a second run yields the same tree and keeps unlisted files.
    auto before = ListTree(pyRoot);
    infrastructure::AtomicFileWriter::Write(pyRoot / "notes.txt", "mine", error);
    assert(materializer.createProjectStructure(py, error));
    auto after = ListTree(pyRoot);
    after.erase("notes.txt");
    assert(before == after && "Repeated materialization must not change the tree.");
    assert(ReadAll(pyRoot / "notes.txt") == "mine" && "Unlisted files survive.");
    std::cout << "[PASS] Structure creation is idempotent." << std::endl;

    // Manifest: written once with the probed runtime version, never overwritten.
    Node web = MakeNode("js1", scaffold::Framework::NodeJs, "Web Front");
    assert(materializer.createProjectStructure(web, error));
    fs::path webRoot = materializer.projectRootFor("js1");
    std::string manifest = ReadAll(webRoot / "package.json");
    assert(manifest.find("\"node\": \"21.6.1\"") != std::string::npos);
    assert(manifest.find("\"name\": \"web-front\"") != std::string::npos);
    infrastructure::AtomicFileWriter::Write(webRoot / "package.json", "{\"edited\": true}", error);
    assert(materializer.createProjectStructure(web, error));
    assert(ReadAll(webRoot / "package.json") == "{\"edited\": true}" && "Manifest is never clobbered.");

    infrastructure::FsProjectMaterializer fallback(
        (testRoot / "fallback").string(), (testRoot / "envs").string(),
        std::make_shared<FixedRuntimeProbe>(std::nullopt));
    assert(fallback.createProjectStructure(web, error) == true);
    // web carries no project path, so the fallback materializer uses its own root.
    std::string fallbackManifest = ReadAll(fs::path(fallback.projectRootFor("js1")) / "package.json");
    assert(fallbackManifest.find("\"node\": \"20.11.0\"") != std::string::npos && "Catalog default on probe failure.");
    std::cout << "[PASS] Manifest pins the detected or default runtime." << std::endl;

    // Save, delete (tolerant), rename.
    ProjectFile extra("x1", "src/lib/helpers.py", "def helper(): pass\n", CodeLanguage::Python);
    assert(materializer.saveFile(py, extra, error));
    assert(ReadAll(pyRoot / "src" / "lib" / "helpers.py") == "def helper(): pass\n");
    assert(materializer.deleteFile(py, extra, error));
    assert(!fs::exists(pyRoot / "src" / "lib" / "helpers.py"));
    assert(materializer.deleteFile(py, extra, error) && "Deleting a missing file is not an error.");

    assert(materializer.renameFile(py, "src/main.py", "src/app.py", error));
    assert(!fs::exists(pyRoot / "src" / "main.py"));
    assert(fs::exists(pyRoot / "src" / "app.py"));

    // A non-empty directory at the target makes the rename fail, whoever runs the test.
    fs::create_directories(pyRoot / "src" / "blocked.py" / "inner");
    error.clear();
    assert(!materializer.renameFile(py, "src/app.py", "src/blocked.py", error));
    assert(!error.empty());
    assert(fs::exists(pyRoot / "src" / "app.py") && "Failed rename leaves the source in place.");

    // An unlisted file at the target survives a rename attempt.
    infrastructure::AtomicFileWriter::Write(pyRoot / "src" / "notes.py", "keep me", error);
    error.clear();
    assert(!materializer.renameFile(py, "src/app.py", "src/notes.py", error));
    assert(error.find("exists") != std::string::npos);
    assert(ReadAll(pyRoot / "src" / "notes.py") == "keep me");
    assert(fs::exists(pyRoot / "src" / "app.py"));

    ProjectFile escaping("e1", "../outside.txt", "x", CodeLanguage::Scaffolding);
    assert(!materializer.saveFile(py, escaping, error) && "Paths may not escape the project root.");
    std::cout << "[PASS] File operations behave at the edges." << std::endl;

    // Purge.
    assert(materializer.removeProjectRoot(py, error));
    assert(!fs::exists(pyRoot));
    std::cout << "[PASS] Purge removes the project root." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
