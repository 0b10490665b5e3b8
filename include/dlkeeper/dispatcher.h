/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace dlkeeper {

// Runs tasks on the thread that owns the transfer registry.
// post() may be called from any thread.
class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;
    virtual void post(Task task) = 0;
};

// Dispatcher backed by a locked queue that the owning thread pumps.
// Used by the CLI main loop and the tests.
class QueueDispatcher : public Dispatcher {
public:
    QueueDispatcher() = default;

    QueueDispatcher(const QueueDispatcher&) = delete;
    QueueDispatcher& operator=(const QueueDispatcher&) = delete;

    void post(Task task) override;

    // Run everything queued so far (and anything those tasks post).
    // Returns the number of tasks executed.
    size_t run_pending();

    // Wait up to timeout for at least one task, then drain the queue
    size_t run_for(std::chrono::milliseconds timeout);

    // Pump until done() holds or the timeout expires; returns done()
    bool run_until(const std::function<bool()>& done,
                   std::chrono::milliseconds timeout = std::chrono::seconds(10));

    size_t queue_size() const;

private:
    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace dlkeeper
