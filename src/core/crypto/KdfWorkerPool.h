// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KdfWorkerPool.h
 * @brief Bounded thread pool for CPU-bound key derivation
 *
 * Argon2id at production parameters takes hundreds of milliseconds and
 * tens of MiB. Running it on a fixed set of worker threads with a bounded
 * queue keeps request dispatch responsive and caps memory use.
 *
 * Every submission carries a hard timeout. When it elapses the caller gets
 * AuthError::ConfigurationError (the parameters are too expensive for this
 * host); the task itself finishes in the background and its result is
 * discarded. Tasks must therefore own everything they touch.
 *
 * @code
 * auto key = pool.run<SecureVector<uint8_t>>(
 *     [secret = std::make_shared<SecureString>(passphrase), salt, params, backend]() {
 *         return backend->derive_key(secret->view(), salt, params);
 *     });
 * @endcode
 */

#pragma once

#include "../AuthError.h"
#include "../../utils/Log.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace AuthKeep {

class KdfWorkerPool {
public:
    struct Options {
        size_t workers = 2;
        size_t queue_capacity = 64;
        std::chrono::milliseconds timeout{5000};
    };

    explicit KdfWorkerPool(Options options);

    /**
     * @brief Drains queued tasks and joins all workers
     */
    ~KdfWorkerPool();

    KdfWorkerPool(const KdfWorkerPool&) = delete;
    KdfWorkerPool& operator=(const KdfWorkerPool&) = delete;
    KdfWorkerPool(KdfWorkerPool&&) = delete;
    KdfWorkerPool& operator=(KdfWorkerPool&&) = delete;

    /**
     * @brief Run a task on a worker and wait for it with the configured timeout
     * @tparam T Success type of the task's AuthResult
     * @param task Callable returning AuthResult<T>; must own its captures
     * @return The task's result, ConfigurationError on timeout, or
     *         InternalError if the queue is full or the task threw
     */
    template<typename T>
    [[nodiscard]] AuthResult<T> run(std::function<AuthResult<T>()> task) {
        auto promise = std::make_shared<std::promise<AuthResult<T>>>();
        auto future = promise->get_future();

        const bool queued = enqueue([promise, task = std::move(task)]() mutable {
            try {
                promise->set_value(task());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        if (!queued) {
            Log::error("KdfWorkerPool: queue full ({} pending), rejecting derivation",
                       m_options.queue_capacity);
            return std::unexpected(AuthError::InternalError);
        }

        if (future.wait_for(m_options.timeout) != std::future_status::ready) {
            Log::error("KdfWorkerPool: derivation exceeded {} ms timeout",
                       m_options.timeout.count());
            return std::unexpected(AuthError::ConfigurationError);
        }

        try {
            return future.get();
        } catch (const std::exception& e) {
            Log::error("KdfWorkerPool: derivation task failed: {}", e.what());
            return std::unexpected(AuthError::InternalError);
        }
    }

    [[nodiscard]] size_t pending() const;
    [[nodiscard]] const Options& options() const noexcept { return m_options; }

private:
    [[nodiscard]] bool enqueue(std::function<void()> job);
    void worker_loop();

    Options m_options;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_queue;
    std::vector<std::thread> m_workers;
    bool m_stopping{false};
};

} // namespace AuthKeep
