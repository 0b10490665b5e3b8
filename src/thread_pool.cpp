/*
 * thread_pool.cpp - Worker threads for blocking transfer jobs
 * Copyright © 2026 Kirn Gill II <segin2005@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "dlkeeper/thread_pool.h"
#include "dlkeeper/log.h"
#include <stdexcept>

namespace dlkeeper {

ThreadPool::ThreadPool(size_t num_threads) {
    size_t count = num_threads > 0 ? num_threads : 1;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::next_job(Job& job) {
    std::unique_lock<std::mutex> lock(mutex_);
    job_ready_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });

    if (jobs_.empty()) {
        return false;
    }

    job = std::move(jobs_.front());
    jobs_.pop_front();
    running_++;
    return true;
}

void ThreadPool::worker_loop() {
    Job job;
    while (next_job(job)) {
        try {
            job();
        } catch (const std::exception& e) {
            log_error(std::string("Transfer job threw: ") + e.what());
        } catch (...) {
            log_error("Transfer job threw an unknown exception");
        }
        job = nullptr;

        std::lock_guard<std::mutex> lock(mutex_);
        running_--;
        if (running_ == 0 && jobs_.empty()) {
            idle_.notify_all();
        }
    }
}

void ThreadPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Cannot submit to stopped thread pool");
        }
        jobs_.push_back(std::move(job));
    }
    job_ready_.notify_one();
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return jobs_.empty() && running_ == 0; });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    job_ready_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace dlkeeper
