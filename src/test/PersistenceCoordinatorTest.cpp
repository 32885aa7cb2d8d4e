#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "application/PersistenceCoordinator.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FsProjectMaterializer.hpp"

using namespace pioneer;
using namespace pioneer::domain;
namespace fs = std::filesystem;
using std::chrono::milliseconds;

namespace {

// Counts writes and can be told to fail them.
class CountingMaterializer : public infrastructure::FsProjectMaterializer {
public:
    using FsProjectMaterializer::FsProjectMaterializer;

    bool saveFile(const Node& node, const ProjectFile& file, std::string& error) override {
        ++writes;
        if (failWrites) {
            error = "simulated disk full";
            return false;
        }
        return FsProjectMaterializer::saveFile(node, file, error);
    }

    std::atomic<int> writes{0};
    std::atomic<bool> failWrites{false};
};

std::string ReadAll(const fs::path& path) {
    std::string content;
    infrastructure::AtomicFileWriter::Read(path, content);
    return content;
}

Node MakeNode(const std::string& id) {
    Node node(id, id, NodeType::Custom, scaffold::Framework::PurePy);
    node.addFile(ProjectFile(id + "-f", "src/main.py", "", CodeLanguage::Python));
    return node;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PersistenceCoordinator Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "pioneer_coordinator_test";
    fs::remove_all(testRoot);

    auto materializer = std::make_shared<CountingMaterializer>(
        (testRoot / "projects").string(), (testRoot / "envs").string(), nullptr);

    // Coalescing: many edits inside the debounce window produce one write of the last content.
    {
        application::PersistenceCoordinator coordinator(materializer, 2, milliseconds(150));
        Node node = MakeNode("n1");
        ProjectFile file = node.getFiles().front();
        for (int i = 0; i < 10; ++i) {
            file.content = "v" + std::to_string(i);
            coordinator.scheduleWrite(node, file);
        }
        assert(coordinator.hasPendingWrite("n1", file.id));
        assert(coordinator.pendingWriteCount() == 1);
        coordinator.flushAll();
        assert(materializer->writes == 1 && "Edits within the window coalesce.");
        assert(ReadAll(fs::path(materializer->projectRootFor("n1")) / "src/main.py") == "v9");

        // X then Y: Y wins once the window has passed, without any flush.
        file.content = "X";
        coordinator.scheduleWrite(node, file);
        file.content = "Y";
        coordinator.scheduleWrite(node, file);
        std::this_thread::sleep_for(milliseconds(600));
        assert(!coordinator.hasPendingWrite("n1", file.id));
        assert(ReadAll(fs::path(materializer->projectRootFor("n1")) / "src/main.py") == "Y");
    }
    std::cout << "[PASS] Latest content wins." << std::endl;

    // Flush promotes a pending write immediately.
    {
        application::PersistenceCoordinator coordinator(materializer, 1, milliseconds(60000));
        Node node = MakeNode("n2");
        ProjectFile file = node.getFiles().front();
        file.content = "hello";
        coordinator.scheduleWrite(node, file);
        auto start = std::chrono::steady_clock::now();
        coordinator.flushFile("n2", file.id);
        assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
        assert(ReadAll(fs::path(materializer->projectRootFor("n2")) / "src/main.py") == "hello");

        // Cancel drops the pending write entirely.
        file.content = "never";
        coordinator.scheduleWrite(node, file);
        coordinator.cancelNode("n2");
        assert(coordinator.pendingWriteCount() == 0);
        coordinator.flushAll();
        assert(ReadAll(fs::path(materializer->projectRootFor("n2")) / "src/main.py") == "hello");

        // stop() drains whatever is still pending.
        file.content = "drained";
        coordinator.scheduleWrite(node, file);
        coordinator.stop();
        assert(ReadAll(fs::path(materializer->projectRootFor("n2")) / "src/main.py") == "drained");

        auto rejected = coordinator.submitNodeJob("n2", application::TaskType::Materialization, "late",
                                                  [](std::string&) { return true; });
        assert(!rejected.get() && "Jobs after stop are rejected.");
    }
    std::cout << "[PASS] Flush, cancel and stop behave as barriers." << std::endl;

    // Jobs for one node run in submission order; results come back through futures.
    {
        application::PersistenceCoordinator coordinator(materializer, 4, milliseconds(10));
        std::mutex orderMutex;
        std::vector<int> order;
        std::vector<std::future<bool>> results;
        for (int i = 0; i < 20; ++i) {
            results.push_back(coordinator.submitNodeJob("same-node", application::TaskType::Materialization,
                "job " + std::to_string(i),
                [i, &orderMutex, &order](std::string&) {
                    std::lock_guard<std::mutex> lock(orderMutex);
                    order.push_back(i);
                    return true;
                }));
        }
        for (auto& r : results) assert(r.get());
        for (int i = 0; i < 20; ++i) assert(order[i] == i);
        assert(coordinator.activeJobs().empty() && "Completed jobs leave the registry.");

        auto failed = coordinator.submitNodeJob("same-node", application::TaskType::Rename, "failing job",
            [](std::string& error) {
                error = "boom";
                return false;
            });
        assert(!failed.get());
        assert(coordinator.failureCount() == 1);
    }
    std::cout << "[PASS] Per-node jobs are ordered." << std::endl;

    // Write failures are counted and reported, never thrown.
    {
        application::PersistenceCoordinator coordinator(materializer, 1, milliseconds(1));
        std::atomic<int> reported{0};
        coordinator.setFailureHandler([&reported](const NodeId& nodeId, const std::string&, const std::string& error) {
            assert(nodeId == "n3");
            assert(error == "simulated disk full");
            ++reported;
        });
        materializer->failWrites = true;
        Node node = MakeNode("n3");
        coordinator.scheduleWrite(node, node.getFiles().front());
        coordinator.flushAll();
        materializer->failWrites = false;
        assert(coordinator.failureCount() == 1);
        assert(reported == 1);
    }
    std::cout << "[PASS] Failures are counted and reported." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
