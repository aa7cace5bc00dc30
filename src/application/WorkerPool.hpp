/**
 * @file WorkerPool.hpp
 * @brief Fixed-size pool of worker threads with a "wait until idle" barrier.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace foldermapper::application {

/**
 * @class WorkerPool
 * @brief Runs submitted tasks on exactly workerCount threads.
 *
 * WaitIdle() blocks until the queue is empty and no task is running, which is
 * what lets the classifier finish a whole batch before pulling the next one.
 * Tasks are expected to handle their own errors; an escaping exception is
 * counted and its message kept, never rethrown on the worker thread.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t workerCount) {
        if (workerCount == 0) {
            throw std::invalid_argument("WorkerPool needs at least one worker");
        }
        m_workers.reserve(workerCount);
        try {
            for (std::size_t i = 0; i < workerCount; ++i) {
                m_workers.emplace_back(&WorkerPool::WorkerLoop, this);
            }
        } catch (...) {
            // Threads already running must be joined before m_workers is destroyed.
            Stop();
            throw;
        }
    }

    ~WorkerPool() { Stop(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** @brief Queues a task. Throws std::runtime_error after Stop(). */
    void Submit(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("WorkerPool has been stopped");
            }
            m_queue.push(std::move(task));
        }
        m_taskAvailable.notify_one();
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitIdle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] { return m_queue.empty() && m_running == 0; });
    }

    /** @brief Drains the queue and joins all workers. Idempotent. */
    void Stop() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) return;
            m_stopping = true;
        }
        m_taskAvailable.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

    std::size_t WorkerCount() const { return m_workers.size(); }

    std::size_t FailedTasks() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_failedTasks;
    }

    std::string LastFailure() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastFailure;
    }

private:
    void WorkerLoop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_taskAvailable.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
                if (m_queue.empty()) {
                    return; // stopping and drained
                }
                task = std::move(m_queue.front());
                m_queue.pop();
                ++m_running;
            }

            std::string failure;
            try {
                task();
            } catch (const std::exception& e) {
                failure = e.what();
                if (failure.empty()) failure = "task failed";
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                --m_running;
                if (!failure.empty()) {
                    ++m_failedTasks;
                    m_lastFailure = failure;
                }
                if (m_queue.empty() && m_running == 0) {
                    m_idle.notify_all();
                }
            }
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_taskAvailable;
    std::condition_variable m_idle;
    std::queue<std::function<void()>> m_queue;
    std::vector<std::thread> m_workers;
    std::size_t m_running = 0;
    std::size_t m_failedTasks = 0;
    std::string m_lastFailure;
    bool m_stopping = false;
};

} // namespace foldermapper::application
