/**
 * @file PersistenceCoordinator.hpp
 * @brief Debounced, per-node serialized background disk I/O.
 *
 * Each node is routed to one worker lane by a hash of its id. Everything queued for a
 * node (structure creation, content writes, renames, deletions) is executed by that
 * lane's single thread, so on-disk effects for one node happen in a well defined order
 * while unrelated nodes progress concurrently.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "domain/Node.hpp"
#include "domain/ProjectMaterializer.hpp"

namespace pioneer::application {

class PersistenceCoordinator {
public:
    /** @brief A node job. Returns false and fills error on failure. */
    using NodeJob = std::function<bool(std::string& error)>;

    /** @brief Invoked on the worker thread for each failed write or job. */
    using FailureHandler = std::function<void(const domain::NodeId& nodeId,
                                              const std::string& what,
                                              const std::string& error)>;

    /**
     * @param materializer Performs the actual disk operations for content writes.
     * @param lanes Number of worker threads (at least one).
     * @param debounce Delay applied to content writes; a new write to the same file
     *        within the window replaces the pending one and re-arms the deadline.
     */
    PersistenceCoordinator(std::shared_ptr<domain::ProjectMaterializer> materializer,
                           std::size_t lanes,
                           std::chrono::milliseconds debounce);
    ~PersistenceCoordinator();

    PersistenceCoordinator(const PersistenceCoordinator&) = delete;
    PersistenceCoordinator& operator=(const PersistenceCoordinator&) = delete;

    /**
     * @brief Queues a debounced write of file (as owned by node) to disk.
     *        Both arguments are copied; the latest scheduled content wins.
     */
    void scheduleWrite(const domain::Node& node, const domain::ProjectFile& file);

    /**
     * @brief Queues an immediate job on the node's lane.
     * @return Future resolving to the job's result once it has run.
     */
    std::future<bool> submitNodeJob(const domain::NodeId& nodeId, TaskType type,
                                    const std::string& description, NodeJob job);

    /** @brief Writes the file's pending content now and blocks until it is on disk. */
    void flushFile(const domain::NodeId& nodeId, const domain::FileId& fileId);

    /** @brief Like flushFile for every file of the node; also waits for its queued jobs. */
    void flushNode(const domain::NodeId& nodeId);

    /** @brief Barrier: returns once every lane has no pending write and no queued job. */
    void flushAll();

    /** @brief Drops the file's pending write and waits for an in-flight one to finish. */
    void cancelFile(const domain::NodeId& nodeId, const domain::FileId& fileId);
    void cancelNode(const domain::NodeId& nodeId);

    bool hasPendingWrite(const domain::NodeId& nodeId, const domain::FileId& fileId) const;
    std::size_t pendingWriteCount() const;
    std::size_t failureCount() const { return m_failures.load(); }
    std::size_t laneCount() const { return m_lanes.size(); }

    /** @brief Snapshot of queued and running node jobs. */
    std::vector<std::shared_ptr<TaskStatus>> activeJobs() { return m_tasks.GetActiveTasks(); }

    void setFailureHandler(FailureHandler handler);

    /** @brief Writes every pending entry, runs queued jobs and joins the workers. */
    void stop();

private:
    using WriteKey = std::pair<domain::NodeId, domain::FileId>;

    struct PendingWrite {
        domain::Node node;
        domain::ProjectFile file;
        std::chrono::steady_clock::time_point due;
    };

    struct QueuedJob {
        domain::NodeId nodeId;
        std::string description;
        NodeJob fn;
        std::shared_ptr<std::promise<bool>> promise;
        std::shared_ptr<TaskStatus> status;
    };

    struct Lane {
        mutable std::mutex mutex;
        std::condition_variable wake;  ///< Signals the worker.
        std::condition_variable idle;  ///< Signals flush/cancel waiters.
        std::map<WriteKey, PendingWrite> pending;
        std::deque<QueuedJob> jobs;
        std::optional<WriteKey> inFlight;
        std::optional<domain::NodeId> jobInFlight;
        bool running = true;
        std::thread worker;
    };

    Lane& laneFor(const domain::NodeId& nodeId) const;
    void workerLoop(Lane& lane);
    void performWrite(const PendingWrite& write);
    void runJob(QueuedJob& job);
    void reportFailure(const domain::NodeId& nodeId, const std::string& what, const std::string& error);

    std::shared_ptr<domain::ProjectMaterializer> m_materializer;
    std::chrono::milliseconds m_debounce;
    std::vector<std::unique_ptr<Lane>> m_lanes;
    AsyncTaskManager m_tasks;

    std::atomic<std::size_t> m_failures{0};
    std::mutex m_handlerMutex;
    FailureHandler m_failureHandler;
};

} // namespace pioneer::application
