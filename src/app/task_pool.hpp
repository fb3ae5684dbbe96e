/**
 * @file    task_pool.hpp
 * @brief   Background work execution and result hand-off
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Renders and thumbnail builds run on a TaskPool; their results are pushed
 * into an EventQueue that the UI thread drains once per frame. The UI
 * thread never blocks on a worker.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace loupe {

using Task = std::function<void()>;

// =============================================================================
// Executor Interface
// =============================================================================

class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /**
     * Schedule a task; it may run on any thread
     */
    virtual void submit(Task task) = 0;
};

/**
 * Runs every task immediately on the calling thread
 */
class InlineExecutor final : public ITaskExecutor {
public:
    void submit(Task task) override;
};

/**
 * Fixed-size worker pool with a FIFO job queue
 *
 * Destruction stops accepting work, finishes queued tasks and joins.
 */
class TaskPool final : public ITaskExecutor {
public:
    explicit TaskPool(std::size_t workers = default_worker_count());
    ~TaskPool() override;

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    void submit(Task task) override;

    [[nodiscard]] std::size_t worker_count() const noexcept { return m_workers.size(); }
    [[nodiscard]] std::size_t pending() const;

    /**
     * hardware_concurrency - 1, at least 1
     */
    [[nodiscard]] static std::size_t default_worker_count() noexcept;

private:
    void worker_loop(std::stop_token stop);

    mutable std::mutex m_mutex;
    std::condition_variable_any m_cv;
    std::deque<Task> m_jobs;
    std::vector<std::jthread> m_workers;
};

// =============================================================================
// Event Queue
// =============================================================================

/**
 * Multi-producer, single-consumer result queue
 */
template <typename T>
class EventQueue {
public:
    void push(T event) {
        std::lock_guard lock(m_mutex);
        m_events.push_back(std::move(event));
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard lock(m_mutex);
        if (m_events.empty()) {
            return std::nullopt;
        }
        T event = std::move(m_events.front());
        m_events.pop_front();
        return event;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard lock(m_mutex);
        return m_events.empty();
    }

private:
    mutable std::mutex m_mutex;
    std::deque<T> m_events;
};

}  // namespace loupe
