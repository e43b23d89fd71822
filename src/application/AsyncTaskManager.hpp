/**
 * @file AsyncTaskManager.hpp
 * @brief Background execution of independent verification submissions.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "domain/Match.hpp"

namespace sourceproof::application {

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 *
 * match and errorMessage are written by the worker before isCompleted is set
 * and must only be read once isCompleted is true.
 */
struct TaskStatus {
    int id = 0;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
    std::optional<domain::Match> match;
};

/**
 * @class AsyncTaskManager
 * @brief Runs each submitted task on its own thread; a failing task never affects the others.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    ~AsyncTaskManager() {
        WaitAll();
    }

    /**
     * @brief Submits a new task to be executed in the background.
     * @param f Callable taking the task's status and returning the Match it produced.
     */
    template<typename F>
    std::shared_ptr<TaskStatus> SubmitTask(const std::string& description, F&& f) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            ++m_running;
        }

        std::thread([this, status](auto userFunc) {
            try {
                status->match = userFunc(status);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f)).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task has completed. */
    void WaitAll() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_running == 0; });
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        --m_running;
        m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    int m_running = 0;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
};

} // namespace sourceproof::application
