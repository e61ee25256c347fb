// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KdfWorkerPool.h"
#include <algorithm>

namespace AuthKeep {

KdfWorkerPool::KdfWorkerPool(Options options)
    : m_options(options) {
    m_options.workers = std::max<size_t>(m_options.workers, 1);
    m_options.queue_capacity = std::max<size_t>(m_options.queue_capacity, 1);

    m_workers.reserve(m_options.workers);
    for (size_t i = 0; i < m_options.workers; ++i) {
        m_workers.emplace_back([this]() { worker_loop(); });
    }
    Log::debug("KdfWorkerPool: started {} workers (queue {}, timeout {} ms)",
               m_options.workers, m_options.queue_capacity, m_options.timeout.count());
}

KdfWorkerPool::~KdfWorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool KdfWorkerPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping || m_queue.size() >= m_options.queue_capacity) {
            return false;
        }
        m_queue.push_back(std::move(job));
    }
    m_cv.notify_one();
    return true;
}

size_t KdfWorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void KdfWorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;  // stopping and drained
            }
            job = std::move(m_queue.front());
            m_queue.pop_front();
        }
        job();
    }
}

} // namespace AuthKeep
