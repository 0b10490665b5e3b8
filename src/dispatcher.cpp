/*
 * src/dispatcher.cpp - Queue-backed task dispatcher
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/dispatcher.h"
#include "dlkeeper/log.h"
#include <algorithm>
#include <exception>

namespace dlkeeper {

void QueueDispatcher::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

size_t QueueDispatcher::run_pending() {
    size_t executed = 0;

    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) break;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            log_error(std::string("Dispatched task threw: ") + e.what());
        }
        executed++;
    }

    return executed;
}

size_t QueueDispatcher::run_for(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !tasks_.empty(); });
    }
    return run_pending();
}

bool QueueDispatcher::run_until(const std::function<bool()>& done,
                                std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    run_pending();
    while (!done()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        run_for(std::min(remaining, std::chrono::milliseconds(50)));
    }
    return true;
}

size_t QueueDispatcher::queue_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace dlkeeper
