/**
 * @file    task_pool.cpp
 * @brief   Background work execution
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "app/task_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace loupe {

namespace {

void run_task(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("Background task failed: {}", e.what());
    }
}

}  // anonymous namespace

void InlineExecutor::submit(Task task) {
    if (task) {
        run_task(task);
    }
}

TaskPool::TaskPool(std::size_t workers) {
    const std::size_t count = std::max<std::size_t>(1, workers);
    m_workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        m_workers.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
    spdlog::debug("Task pool started with {} workers", count);
}

TaskPool::~TaskPool() {
    for (auto& worker : m_workers) {
        worker.request_stop();
    }
    m_cv.notify_all();
    m_workers.clear();   // jthread joins
}

void TaskPool::submit(Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard lock(m_mutex);
        m_jobs.push_back(std::move(task));
    }
    m_cv.notify_one();
}

std::size_t TaskPool::pending() const {
    std::lock_guard lock(m_mutex);
    return m_jobs.size();
}

std::size_t TaskPool::default_worker_count() noexcept {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 1 ? hw - 1 : 1;
}

void TaskPool::worker_loop(std::stop_token stop) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(m_mutex);
            m_cv.wait(lock, stop, [this] { return !m_jobs.empty(); });

            // Queued work is drained even after a stop request
            if (m_jobs.empty()) {
                return;
            }
            task = std::move(m_jobs.front());
            m_jobs.pop_front();
        }
        run_task(task);
    }
}

}  // namespace loupe
