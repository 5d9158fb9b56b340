/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <algorithm>

namespace deepresearch::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Pipeline, ///< A sequential phase of one run.
    Search    ///< One search task of the fan-out.
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Manages background execution and provides unified status tracking.
 *
 * Must be owned by a std::shared_ptr: running tasks hold a reference to the manager,
 * so it outlives every task it launched.
 */
class AsyncTaskManager : public std::enable_shared_from_this<AsyncTaskManager> {
public:
    AsyncTaskManager() = default;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        std::thread([self = shared_from_this(), status](auto userFunc, auto... userArgs) {
            try {
                // Call the user function with status as first arg, followed by other args
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
            }
            status->isCompleted = true;
            self->CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
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

} // namespace deepresearch::application
