/**
 * @file PersistenceCoordinator.cpp
 * @brief Implementation of PersistenceCoordinator.
 */

#include "application/PersistenceCoordinator.hpp"

#include <algorithm>
#include <iostream>

namespace pioneer::application {

using Clock = std::chrono::steady_clock;

PersistenceCoordinator::PersistenceCoordinator(std::shared_ptr<domain::ProjectMaterializer> materializer,
                                               std::size_t lanes,
                                               std::chrono::milliseconds debounce)
    : m_materializer(std::move(materializer)),
      m_debounce(debounce) {
    const std::size_t count = std::max<std::size_t>(1, lanes);
    m_lanes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        m_lanes.push_back(std::make_unique<Lane>());
    }
    for (auto& lane : m_lanes) {
        Lane* raw = lane.get();
        raw->worker = std::thread([this, raw] { workerLoop(*raw); });
    }
}

PersistenceCoordinator::~PersistenceCoordinator() {
    stop();
}

PersistenceCoordinator::Lane& PersistenceCoordinator::laneFor(const domain::NodeId& nodeId) const {
    return *m_lanes[std::hash<std::string>{}(nodeId) % m_lanes.size()];
}

void PersistenceCoordinator::scheduleWrite(const domain::Node& node, const domain::ProjectFile& file) {
    Lane& lane = laneFor(node.getId());
    {
        std::lock_guard<std::mutex> lock(lane.mutex);
        if (!lane.running) {
            std::cerr << "[PersistenceCoordinator] Stopped; dropping write of " << file.path << std::endl;
            return;
        }
        WriteKey key{node.getId(), file.id};
        auto it = lane.pending.find(key);
        if (it != lane.pending.end()) {
            it->second.node = node;
            it->second.file = file;
            it->second.due = Clock::now() + m_debounce;
        } else {
            lane.pending.emplace(key, PendingWrite{node, file, Clock::now() + m_debounce});
        }
    }
    lane.wake.notify_one();
}

std::future<bool> PersistenceCoordinator::submitNodeJob(const domain::NodeId& nodeId, TaskType type,
                                                        const std::string& description, NodeJob job) {
    auto promise = std::make_shared<std::promise<bool>>();
    std::future<bool> result = promise->get_future();

    Lane& lane = laneFor(nodeId);
    {
        std::lock_guard<std::mutex> lock(lane.mutex);
        if (!lane.running) {
            std::cerr << "[PersistenceCoordinator] Stopped; rejecting job: " << description << std::endl;
            promise->set_value(false);
            return result;
        }
        auto status = m_tasks.BeginTask(type, nodeId, description);
        lane.jobs.push_back(QueuedJob{nodeId, description, std::move(job), promise, status});
    }
    lane.wake.notify_one();
    return result;
}

void PersistenceCoordinator::flushFile(const domain::NodeId& nodeId, const domain::FileId& fileId) {
    Lane& lane = laneFor(nodeId);
    const WriteKey key{nodeId, fileId};
    std::unique_lock<std::mutex> lock(lane.mutex);
    auto it = lane.pending.find(key);
    if (it != lane.pending.end()) {
        it->second.due = Clock::now();
        lane.wake.notify_one();
    }
    lane.idle.wait(lock, [&] {
        return lane.pending.count(key) == 0 && lane.inFlight != key;
    });
}

void PersistenceCoordinator::flushNode(const domain::NodeId& nodeId) {
    Lane& lane = laneFor(nodeId);
    auto ownedByNode = [&](const WriteKey& key) { return key.first == nodeId; };

    std::unique_lock<std::mutex> lock(lane.mutex);
    const auto now = Clock::now();
    for (auto& entry : lane.pending) {
        if (ownedByNode(entry.first)) entry.second.due = now;
    }
    lane.wake.notify_one();
    lane.idle.wait(lock, [&] {
        if (lane.inFlight && ownedByNode(*lane.inFlight)) return false;
        if (lane.jobInFlight == nodeId) return false;
        if (std::any_of(lane.jobs.begin(), lane.jobs.end(),
                        [&](const QueuedJob& job) { return job.nodeId == nodeId; })) {
            return false;
        }
        return std::none_of(lane.pending.begin(), lane.pending.end(),
                            [&](const auto& entry) { return ownedByNode(entry.first); });
    });
}

void PersistenceCoordinator::flushAll() {
    for (auto& lanePtr : m_lanes) {
        Lane& lane = *lanePtr;
        std::unique_lock<std::mutex> lock(lane.mutex);
        const auto now = Clock::now();
        for (auto& entry : lane.pending) entry.second.due = now;
        lane.wake.notify_one();
        lane.idle.wait(lock, [&] {
            return lane.pending.empty() && lane.jobs.empty() && !lane.inFlight && !lane.jobInFlight;
        });
    }
}

void PersistenceCoordinator::cancelFile(const domain::NodeId& nodeId, const domain::FileId& fileId) {
    Lane& lane = laneFor(nodeId);
    const WriteKey key{nodeId, fileId};
    std::unique_lock<std::mutex> lock(lane.mutex);
    lane.pending.erase(key);
    lane.idle.wait(lock, [&] { return lane.inFlight != key; });
}

void PersistenceCoordinator::cancelNode(const domain::NodeId& nodeId) {
    Lane& lane = laneFor(nodeId);
    std::unique_lock<std::mutex> lock(lane.mutex);
    for (auto it = lane.pending.begin(); it != lane.pending.end();) {
        if (it->first.first == nodeId) {
            it = lane.pending.erase(it);
        } else {
            ++it;
        }
    }
    lane.idle.wait(lock, [&] { return !lane.inFlight || lane.inFlight->first != nodeId; });
}

bool PersistenceCoordinator::hasPendingWrite(const domain::NodeId& nodeId, const domain::FileId& fileId) const {
    Lane& lane = laneFor(nodeId);
    std::lock_guard<std::mutex> lock(lane.mutex);
    return lane.pending.count(WriteKey{nodeId, fileId}) > 0;
}

std::size_t PersistenceCoordinator::pendingWriteCount() const {
    std::size_t total = 0;
    for (const auto& lane : m_lanes) {
        std::lock_guard<std::mutex> lock(lane->mutex);
        total += lane->pending.size();
    }
    return total;
}

void PersistenceCoordinator::setFailureHandler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_failureHandler = std::move(handler);
}

void PersistenceCoordinator::stop() {
    for (auto& lane : m_lanes) {
        {
            std::lock_guard<std::mutex> lock(lane->mutex);
            lane->running = false;
        }
        lane->wake.notify_all();
    }
    for (auto& lane : m_lanes) {
        if (lane->worker.joinable()) {
            lane->worker.join();
        }
    }
}

void PersistenceCoordinator::workerLoop(Lane& lane) {
    std::unique_lock<std::mutex> lock(lane.mutex);
    while (true) {
        // Jobs are immediate; content writes wait for their debounce deadline,
        // except while draining.
        if (!lane.jobs.empty()) {
            QueuedJob job = std::move(lane.jobs.front());
            lane.jobs.pop_front();
            lane.jobInFlight = job.nodeId;
            lock.unlock();
            runJob(job);
            lock.lock();
            lane.jobInFlight.reset();
            lane.idle.notify_all();
            continue;
        }

        auto next = std::min_element(lane.pending.begin(), lane.pending.end(),
            [](const auto& a, const auto& b) { return a.second.due < b.second.due; });

        if (next != lane.pending.end() && (!lane.running || next->second.due <= Clock::now())) {
            PendingWrite write = std::move(next->second);
            lane.inFlight = next->first;
            lane.pending.erase(next);
            lock.unlock();
            performWrite(write);
            lock.lock();
            lane.inFlight.reset();
            lane.idle.notify_all();
            continue;
        }

        if (!lane.running) {
            lane.idle.notify_all();
            return;
        }

        if (next != lane.pending.end()) {
            lane.wake.wait_until(lock, next->second.due);
        } else {
            lane.wake.wait(lock);
        }
    }
}

void PersistenceCoordinator::performWrite(const PendingWrite& write) {
    std::string error;
    if (!m_materializer->saveFile(write.node, write.file, error)) {
        reportFailure(write.node.getId(), "write " + write.file.path, error);
    }
}

void PersistenceCoordinator::runJob(QueuedJob& job) {
    job.status->isRunning = true;
    bool ok = false;
    std::string error;
    try {
        ok = job.fn(error);
    } catch (const std::exception& e) {
        ok = false;
        error = e.what();
    }

    if (!ok) {
        reportFailure(job.nodeId, job.description, error);
    }
    m_tasks.CompleteTask(job.status, ok, error);
    job.promise->set_value(ok);
}

void PersistenceCoordinator::reportFailure(const domain::NodeId& nodeId, const std::string& what,
                                           const std::string& error) {
    ++m_failures;
    std::cerr << "[PersistenceCoordinator] " << what << " failed for node " << nodeId
              << ": " << error << std::endl;

    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_failureHandler;
    }
    if (handler) handler(nodeId, what, error);
}

} // namespace pioneer::application
