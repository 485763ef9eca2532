/**
 * @file TaskPool.hpp
 * @brief Fixed-size worker pool with futures and unified status tracking.
 */

#pragma once

#include <string>
#include <vector>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <thread>
#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace docweave::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Embedding,
    Document
};

/**
 * @struct TaskStatus
 * @brief Information about a queued, running or completed task.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Document;
    std::string description;
    std::atomic<bool> isRunning{false};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class TaskPool
 * @brief Runs submitted work on a fixed set of worker threads.
 *
 * A task submitted to a pool must never block on another task of the same
 * pool; nested fan-out goes to a separate pool instance.
 */
class TaskPool {
public:
    explicit TaskPool(size_t workers) {
        const size_t count = std::max<size_t>(1, workers);
        m_workers.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            m_workers.emplace_back([this]() { WorkerLoop(); });
        }
    }

    ~TaskPool() {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_stopping = true;
        }
        m_cv.notify_all();
        for (auto& t : m_workers) {
            if (t.joinable()) t.join();
        }
    }

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /**
     * @brief Queues a callable and returns its future.
     *
     * Exceptions thrown by the callable are recorded on the TaskStatus and
     * rethrown from future::get().
     */
    template<typename F>
    auto Submit(TaskType type, const std::string& description, F&& f)
        -> std::pair<std::future<std::invoke_result_t<F>>, std::shared_ptr<TaskStatus>> {
        using R = std::invoke_result_t<F>;

        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        auto wrapped = [status, fn = std::forward<F>(f)]() mutable -> R {
            struct Completion {
                TaskStatus& s;
                ~Completion() {
                    s.isRunning = false;
                    s.isCompleted = true;
                }
            } done{*status};
            status->isRunning = true;
            try {
                return fn();
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                throw;
            }
        };

        auto task = std::make_shared<std::packaged_task<R()>>(std::move(wrapped));
        std::future<R> future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            if (m_stopping) {
                throw std::runtime_error("TaskPool is shutting down");
            }
            m_queue.emplace_back([this, task]() {
                (*task)();
                CleanupCompletedTasks();
            });
        }
        m_cv.notify_one();

        return {std::move(future), status};
    }

    /** @brief Returns snapshots of all tasks not yet completed. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    size_t WorkerCount() const { return m_workers.size(); }

private:
    void WorkerLoop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_cv.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
                if (m_queue.empty()) return;
                job = std::move(m_queue.front());
                m_queue.pop_front();
            }
            job();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::thread> m_workers;
    std::deque<std::function<void()>> m_queue;
    std::mutex m_queueMutex;
    std::condition_variable m_cv;
    bool m_stopping = false;

    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
};

} // namespace docweave::application
