/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace dlkeeper {

// Fixed set of workers for blocking transfer jobs (fetches and HEAD requests).
// A job that throws is logged and does not take its worker down.
class ThreadPool {
public:
    using Job = std::function<void()>;

    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Queue a job; throws std::runtime_error after shutdown()
    void submit(Job job);

    // Block until the queue is empty and no job is running
    void wait_all();

    // Stop accepting jobs, finish queued ones, join workers (idempotent)
    void shutdown();

    size_t thread_count() const { return workers_.size(); }

private:
    void worker_loop();

    // Next queued job; false once stopping with an empty queue
    bool next_job(Job& job);

    std::vector<std::thread> workers_;
    std::deque<Job> jobs_;
    size_t running_ = 0;
    bool stopping_ = false;

    std::mutex mutex_;
    std::condition_variable job_ready_;
    std::condition_variable idle_;
};

} // namespace dlkeeper
