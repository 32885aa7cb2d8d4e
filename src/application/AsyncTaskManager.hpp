/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized status tracking for background disk work.
 */

#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <memory>
#include <algorithm>

#include "domain/Identifiers.hpp"

namespace pioneer::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Materialization,
    Rename,
    FileDeletion,
    Purge
};

inline const char* TaskTypeToString(TaskType type) {
    switch (type) {
        case TaskType::Materialization: return "materialization";
        case TaskType::Rename: return "rename";
        case TaskType::FileDeletion: return "file-deletion";
        case TaskType::Purge: return "purge";
    }
    return "unknown";
}

/**
 * @struct TaskStatus
 * @brief Information about a queued, running or completed task.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Materialization;
    domain::NodeId nodeId;
    std::string description;
    std::atomic<bool> isRunning{false};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Registry of background tasks. The executor owns the threads; this class
 *        only hands out status records and drops them once completed.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;

    /** @brief Registers a new task and returns its status record. */
    std::shared_ptr<TaskStatus> BeginTask(TaskType type, const domain::NodeId& nodeId, const std::string& description) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->nodeId = nodeId;
        status->description = description;

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.push_back(status);
        return status;
    }

    /** @brief Marks a task finished and forgets every completed task. */
    void CompleteTask(const std::shared_ptr<TaskStatus>& status, bool success, const std::string& error = "") {
        if (!success) {
            status->errorMessage = error;
            status->failed = true;
        }
        status->isRunning = false;
        status->isCompleted = true;
        CleanupCompletedTasks();
    }

    /** @brief Returns all tasks not yet completed. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
};

} // namespace pioneer::application
