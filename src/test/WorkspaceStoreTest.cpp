#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>

#include "application/WorkspaceStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FsProjectMaterializer.hpp"

using namespace pioneer;
using namespace pioneer::domain;
using application::WorkspaceStore;
using application::RenameOutcome;
namespace fs = std::filesystem;
using std::chrono::milliseconds;

namespace {

// Every rename fails, as if the disk were read-only.
class ReadOnlyRenameMaterializer : public infrastructure::FsProjectMaterializer {
public:
    using FsProjectMaterializer::FsProjectMaterializer;

    bool renameFile(const Node&, const std::string&, const std::string&, std::string& error) override {
        error = "read-only file system";
        return false;
    }
};

struct Fixture {
    Fixture(const fs::path& root, milliseconds debounce,
            application::DeletionPolicy policy = application::DeletionPolicy::Orphan) {
        materializer = std::make_shared<infrastructure::FsProjectMaterializer>(
            (root / "projects").string(), (root / "envs").string(), nullptr);
        coordinator = std::make_shared<application::PersistenceCoordinator>(materializer, 2, debounce);
        WorkspaceStore::Options options;
        options.deletionPolicy = policy;
        store = std::make_unique<WorkspaceStore>(materializer, coordinator, options);
    }

    std::shared_ptr<infrastructure::FsProjectMaterializer> materializer;
    std::shared_ptr<application::PersistenceCoordinator> coordinator;
    std::unique_ptr<WorkspaceStore> store;
};

std::string ReadAll(const fs::path& path) {
    std::string content;
    infrastructure::AtomicFileWriter::Read(path, content);
    return content;
}

void AssertInvariants(const WorkspaceStore& store) {
    for (const auto& id : store.nodeIds()) {
        auto node = store.getNode(id);
        assert(node && "Listed ids resolve.");
        assert(node->checkInvariants() && "Every node keeps its invariants.");
    }
    if (auto selected = store.selectedNodeId()) {
        assert(store.getNode(*selected) && "Selected node resolves.");
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting WorkspaceStore Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "pioneer_store_test";
    fs::remove_all(testRoot);

    {
        Fixture fx(testRoot / "basic", milliseconds(50));
        WorkspaceStore& store = *fx.store;

        // Creation: one main file from the catalog, selected, rooted.
        NodeId py = store.createNode(NodeType::Custom, scaffold::Framework::PurePy);
        auto node = store.getNode(py);
        assert(node);
        assert(node->getName() == "New Node 1");
        assert(node->getPosition().x == 200.0f && node->getPosition().y == 200.0f);
        assert(node->getFiles().size() == 1);
        assert(node->getFiles().front().path == "src/main.py");
        assert(node->getLanguage() == CodeLanguage::Python);
        assert(store.selectedNodeId() == py);
        assert(store.selectedFile()->id == node->getFiles().front().id);
        assert(*node->getProjectPath() == fx.materializer->projectRootFor(py));
        assert(*node->getEnvironmentPath() == fx.materializer->environmentPathFor(py));

        NodeId web = store.createNode(NodeType::Website, scaffold::Framework::Swift);
        assert(store.getNode(web)->getName() == "New Node 2");
        assert(store.getNode(web)->getPosition().x == 250.0f);
        assert(!store.getNode(web)->getEnvironmentPath() && "Compiled languages get no environment.");
        assert(store.selectedNodeId() == web);
        assert(py != web);

        store.flushAll();
        assert(fs::exists(fs::path(*node->getProjectPath()) / "src" / "main.py"));
        std::cout << "[PASS] createNode scaffolds, selects and materializes." << std::endl;

        // Deleting the only file regenerates a fresh main file.
        FileId firstMain = node->getFiles().front().id;
        assert(store.removeFile(py, firstMain));
        node = store.getNode(py);
        assert(node->getFiles().size() == 1);
        assert(node->getFiles().front().path == "src/main.py");
        assert(node->getFiles().front().id != firstMain && "Ids are never reused.");
        assert(node->getSelectedFileId() == node->getFiles().front().id);
        store.flushAll();
        assert(fs::exists(fs::path(*node->getProjectPath()) / "src" / "main.py"));
        AssertInvariants(store);
        std::cout << "[PASS] Removing the last file regenerates the main file." << std::endl;

        // addFile validation.
        assert(!store.addFile(py, ""));
        assert(!store.addFile(py, "/etc/passwd"));
        assert(!store.addFile(py, "../escape.py"));
        assert(!store.addFile(py, "src/../../escape.py"));
        assert(!store.addFile(py, "src/main.py") && "Duplicate path rejected.");
        assert(!store.addFile("ghost", "x.py"));
        auto util = store.addFile(py, "src/util.py");
        assert(util);
        assert(store.getFile(py, *util)->language == CodeLanguage::Python);
        assert(store.getNode(py)->getSelectedFileId() == *util && "New file is selected.");
        auto readme = store.addFile(py, "docs/notes.txt", CodeLanguage::Markdown);
        assert(store.getFile(py, *readme)->language == CodeLanguage::Markdown);
        store.flushAll();
        assert(fs::exists(fs::path(*node->getProjectPath()) / "src" / "util.py"));

        // Removing the selected file moves selection to the first remaining one.
        assert(store.removeFile(py, *readme));
        auto afterRemove = store.getNode(py);
        assert(afterRemove->getSelectedFileId() == afterRemove->getFiles().front().id);
        store.flushAll();
        assert(!fs::exists(fs::path(*node->getProjectPath()) / "docs" / "notes.txt"));
        std::cout << "[PASS] addFile/removeFile keep selection valid." << std::endl;

        // Content: X then Y ends with Y on disk.
        FileId utilId = *util;
        assert(store.updateFileContent(py, utilId, "X"));
        assert(store.updateFileContent(py, utilId, "Y"));
        store.flushAll();
        assert(ReadAll(fs::path(*node->getProjectPath()) / "src" / "util.py") == "Y");

        // Re-sending unchanged content still rewrites the file.
        fs::remove(fs::path(*node->getProjectPath()) / "src" / "util.py");
        assert(store.updateFileContent(py, utilId, "Y"));
        store.flushAll();
        assert(ReadAll(fs::path(*node->getProjectPath()) / "src" / "util.py") == "Y");
        std::cout << "[PASS] Last edit wins on disk." << std::endl;

        // Rename.
        assert(store.renameFile(py, utilId, "").outcome == RenameOutcome::Rejected);
        assert(store.renameFile(py, utilId, "a/b.py").outcome == RenameOutcome::Rejected);
        assert(store.renameFile(py, utilId, "main.py").outcome == RenameOutcome::Rejected);
        assert(store.renameFile(py, "nope", "x.py").outcome == RenameOutcome::NotFound);
        auto renamed = store.renameFile(py, utilId, "helpers.py");
        assert(renamed.ok());
        assert(store.getFile(py, utilId)->path == "src/helpers.py");
        assert(store.getFile(py, utilId)->name == "helpers.py");
        assert(ReadAll(fs::path(*node->getProjectPath()) / "src" / "helpers.py") == "Y");
        assert(!fs::exists(fs::path(*node->getProjectPath()) / "src" / "util.py"));
        assert(store.renameFile(py, utilId, "HELPERS.md").ok());
        assert(store.getFile(py, utilId)->language == CodeLanguage::Markdown && "Language follows the extension.");

        // Disk failure: a directory occupies the target path.
        fs::create_directories(fs::path(*node->getProjectPath()) / "src" / "taken.py" / "inner");
        auto failed = store.renameFile(py, utilId, "taken.py");
        assert(failed.outcome == RenameOutcome::DiskFailure);
        assert(!failed.error.empty());
        assert(store.getFile(py, utilId)->path == "src/HELPERS.md" && "Path rolled back.");
        assert(store.getFile(py, utilId)->name == "HELPERS.md" && "Name rolled back.");

        // An unlisted scaffold seed at the target is never overwritten.
        store.flushAll();
        const fs::path seed = fs::path(*node->getProjectPath()) / "src" / "__init__.py";
        std::string writeError;
        assert(infrastructure::AtomicFileWriter::Write(seed, "user notes", writeError));
        auto clobber = store.renameFile(py, utilId, "__init__.py");
        assert(clobber.outcome == RenameOutcome::DiskFailure);
        assert(store.getFile(py, utilId)->path == "src/HELPERS.md");
        assert(ReadAll(seed) == "user notes");
        std::cout << "[PASS] renameFile validates, applies and rolls back." << std::endl;

        // Connections.
        assert(store.connect(py, web));
        assert(store.connect(py, web) && "Connect is idempotent.");
        assert(store.getNode(py)->getConnections().size() == 1);
        assert(!store.connect(py, py));
        assert(!store.connect(py, "ghost"));
        assert(store.connect(web, py) && "Cycles are allowed.");
        assert(store.disconnect(web, py));
        assert(!store.disconnect(web, py));

        // Deleting B cascades into A's connections and the selection.
        assert(store.selectNode(web));
        assert(store.deleteNode(web));
        assert(store.getNode(py)->getConnections().empty());
        assert(!store.selectedNodeId());
        assert(!store.getNode(web));
        assert(store.nodeIds().size() == 1);
        store.flushAll();
        assert(fs::exists(fx.materializer->projectRootFor(web)) && "Orphan policy keeps the directory.");
        std::cout << "[PASS] Deleting a node cascades connection removal." << std::endl;

        // Not-found operations are no-ops.
        assert(!store.deleteNode(web));
        assert(!store.selectNode(web));
        assert(!store.selectFile(py, "ghost"));
        assert(!store.updateFileContent(web, utilId, "zzz"));
        assert(!store.updateFileContent(py, "ghost", "zzz"));
        assert(!store.renameNode(web, "x"));
        assert(!store.moveNode(web, Position{1, 1}));
        assert(!store.changeFramework(web, scaffold::Framework::Go));
        assert(!store.getFile(web, utilId));
        AssertInvariants(store);
        std::cout << "[PASS] Stale ids are benign." << std::endl;

        // Framework switch: the new main file exists and is selected.
        assert(store.changeFramework(py, scaffold::Framework::Flask));
        auto flask = store.getNode(py);
        assert(flask->getFramework() == scaffold::Framework::Flask);
        const ProjectFile* appPy = flask->findFileByPath("app.py");
        assert(appPy);
        assert(flask->getSelectedFileId() == appPy->id);
        assert(flask->findFileByPath("src/main.py") && "Existing files are kept.");
        store.flushAll();
        assert(fs::exists(fs::path(*flask->getProjectPath()) / "requirements.txt"));

        // Metadata and canvas.
        assert(store.renameNode(py, "Backend API"));
        assert(!store.renameNode(py, ""));
        assert(store.getNode(py)->getName() == "Backend API");
        assert(store.moveNode(py, Position{10.0f, 20.0f}));
        assert(store.getNode(py)->getPosition().y == 20.0f);
        store.setCanvasScale(5.0f);
        assert(store.canvas().scale == CanvasTransform::kMaxScale);
        store.setCanvasScale(0.1f);
        assert(store.canvas().scale == CanvasTransform::kMinScale);
        store.panCanvas(5.0f, -5.0f);
        store.panCanvas(5.0f, -5.0f);
        assert(store.canvas().offset.x == 10.0f && store.canvas().offset.y == -10.0f);
        store.resetCanvas();
        assert(store.canvas().scale == 1.0f && store.canvas().offset.x == 0.0f);
        std::cout << "[PASS] Metadata, framework and canvas updates." << std::endl;
    }

    // Flush-before-switch: a long debounce would keep the edit in memory only.
    {
        Fixture fx(testRoot / "switch", milliseconds(60000));
        WorkspaceStore& store = *fx.store;
        NodeId a = store.createNode(NodeType::Custom, scaffold::Framework::PurePy);
        NodeId b = store.createNode(NodeType::Custom, scaffold::Framework::PurePy);
        store.selectNode(a);
        FileId mainA = *store.getNode(a)->getSelectedFileId();
        store.flushAll();

        assert(store.updateFileContent(a, mainA, "hello"));
        assert(fx.coordinator->hasPendingWrite(a, mainA));
        assert(store.selectNode(b));
        assert(!fx.coordinator->hasPendingWrite(a, mainA));
        assert(ReadAll(fs::path(fx.materializer->projectRootFor(a)) / "src" / "main.py") == "hello");

        auto extra = store.addFile(b, "src/extra.py");
        FileId mainB = store.getNode(b)->findFileByPath("src/main.py")->id;
        assert(store.selectFile(b, mainB));
        assert(store.updateFileContent(b, mainB, "edited"));
        assert(store.selectFile(b, *extra));
        assert(ReadAll(fs::path(fx.materializer->projectRootFor(b)) / "src" / "main.py") == "edited");

        assert(store.updateFileContent(b, *extra, "pending"));
        store.clearSelection();
        assert(ReadAll(fs::path(fx.materializer->projectRootFor(b)) / "src" / "extra.py") == "pending");
        std::cout << "[PASS] Pending edits are flushed before selection changes." << std::endl;

        // Cancel-before-delete: the pending edit never lands after removal.
        assert(store.updateFileContent(b, *extra, "late"));
        assert(store.removeFile(b, *extra));
        store.flushAll();
        assert(!fs::exists(fs::path(fx.materializer->projectRootFor(b)) / "src" / "extra.py"));
        std::cout << "[PASS] Removed files are not resurrected." << std::endl;
    }

    // Rename rolled back when the disk refuses.
    {
        auto materializer = std::make_shared<ReadOnlyRenameMaterializer>(
            (testRoot / "readonly" / "projects").string(), (testRoot / "readonly" / "envs").string(), nullptr);
        auto coordinator = std::make_shared<application::PersistenceCoordinator>(materializer, 1, milliseconds(10));
        WorkspaceStore store(materializer, coordinator);
        NodeId id = store.createNode(NodeType::MacOSApp, scaffold::Framework::SwiftUI);
        FileId main = *store.getNode(id)->getSelectedFileId();
        const std::string originalPath = store.getFile(id, main)->path;
        auto result = store.renameFile(id, main, "Renamed.swift");
        assert(result.outcome == RenameOutcome::DiskFailure);
        assert(result.error == "read-only file system");
        assert(store.getFile(id, main)->path == originalPath);
        std::cout << "[PASS] Rename with disk failure leaves memory unchanged." << std::endl;
    }

    // Purge policy removes the project directory.
    {
        Fixture fx(testRoot / "purge", milliseconds(10), application::DeletionPolicy::Purge);
        NodeId id = fx.store->createNode(NodeType::Website, scaffold::Framework::React);
        fx.store->flushAll();
        fs::path root = fx.materializer->projectRootFor(id);
        assert(fs::exists(root / "package.json"));
        assert(fx.store->deleteNode(id));
        fx.store->flushAll();
        assert(!fs::exists(root));
        std::cout << "[PASS] Purge policy removes disk content." << std::endl;
    }

    // Listeners run after the mutation, outside the lock.
    {
        Fixture fx(testRoot / "events", milliseconds(10));
        WorkspaceStore& store = *fx.store;
        std::atomic<int> created{0};
        std::atomic<int> total{0};
        auto token = store.subscribe([&](const application::WorkspaceEvent& event) {
            ++total;
            if (event.kind == application::WorkspaceEventKind::NodeCreated) {
                ++created;
                // Re-entrant reads must not deadlock.
                assert(store.getNode(*event.nodeId));
            }
        });
        store.createNode(NodeType::Custom, scaffold::Framework::Go);
        assert(created == 1);
        store.unsubscribe(token);
        store.createNode(NodeType::Custom, scaffold::Framework::Go);
        assert(created == 1);
        assert(total >= 2);
        std::cout << "[PASS] Events are delivered to subscribers." << std::endl;
    }

    // Loading an imported document repairs invariants.
    {
        Fixture fx(testRoot / "load", milliseconds(10));
        WorkspaceStore& store = *fx.store;

        WorkspaceDocument doc;
        doc.name = "Imported";
        doc.canvas.scale = 9.0f;
        Node empty("n-empty", "Empty", NodeType::Custom, scaffold::Framework::PurePy);
        empty.connect("n-full");
        empty.connect("n-ghost");
        Node full("n-full", "Full", NodeType::Website, scaffold::Framework::NodeJs);
        full.addFile(ProjectFile("f1", "src/index.js", "console.log(1)", CodeLanguage::JavaScript));
        full.addFile(ProjectFile("f2", "../../etc/evil", "x", CodeLanguage::Scaffolding));
        full.assignProjectPath((testRoot / "load" / "shared").string());
        Node twin("n-twin", "Twin", NodeType::Custom, scaffold::Framework::PurePy);
        twin.addFile(ProjectFile("f3", "src/main.py", "twin", CodeLanguage::Python));
        twin.assignProjectPath((testRoot / "load" / "shared").string());
        twin.assignEnvironmentPath((testRoot / "load" / "shared-env").string());
        Node duplicate("n-full", "Duplicate", NodeType::Custom, scaffold::Framework::Go);
        doc.nodes = {empty, full, twin, duplicate};
        doc.selectedNodeId = std::string("n-ghost");

        store.loadDocument(doc);
        assert(store.workspaceName() == "Imported");
        assert(store.nodeIds().size() == 3 && "Duplicate ids are dropped.");
        assert(store.canvas().scale == CanvasTransform::kMaxScale);
        assert(!store.selectedNodeId() && "Dangling selection is cleared.");

        auto repaired = store.getNode("n-empty");
        assert(repaired->getFiles().size() == 1 && "Empty file sets are refilled.");
        assert(repaired->getFiles().front().path == "src/main.py");
        assert(repaired->getConnections().size() == 1 && repaired->getConnections().front() == "n-full");
        assert(store.getNode("n-full")->getFiles().size() == 1 && "Unsafe paths are dropped.");
        assert(store.getNode("n-full")->getName() == "Full");
        AssertInvariants(store);

        // Stored roots are not trusted: every node gets its own derived directory.
        assert(*store.getNode("n-full")->getProjectPath() == fx.materializer->projectRootFor("n-full"));
        assert(*store.getNode("n-twin")->getProjectPath() == fx.materializer->projectRootFor("n-twin"));
        assert(*store.getNode("n-twin")->getEnvironmentPath() == fx.materializer->environmentPathFor("n-twin"));

        store.flushAll();
        assert(ReadAll(fs::path(fx.materializer->projectRootFor("n-full")) / "src" / "index.js") == "console.log(1)");
        assert(ReadAll(fs::path(fx.materializer->projectRootFor("n-twin")) / "src" / "main.py") == "twin");
        assert(!fs::exists(testRoot / "load" / "shared"));

        auto exported = store.exportDocument();
        assert(exported.nodes.size() == 3);
        assert(exported.nodes.front().getId() == "n-empty" && "Document order is preserved.");

        store.newWorkspace("Fresh");
        assert(store.nodeIds().empty());
        assert(store.workspaceName() == "Fresh");
        std::cout << "[PASS] Imported documents are repaired." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
