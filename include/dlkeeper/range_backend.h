/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <memory>
#include <string>
#include "dlkeeper/config.h"
#include "dlkeeper/dispatcher.h"
#include "dlkeeper/http_session.h"
#include "dlkeeper/thread_pool.h"
#include "dlkeeper/transfer_registry.h"

namespace dlkeeper {

// Drives transfers with plain HTTP GETs, resuming with "Range: bytes=N-".
//
// Public methods run on the registry thread. The body is streamed on a
// ThreadPool worker; every registry update goes back through the
// Dispatcher. The pool must be drained before this object is destroyed.
class RangeBackend {
public:
    RangeBackend(TransferRegistry& registry, Dispatcher& dispatcher, HttpSession& http,
                 ThreadPool& pool, const TransferConfig& config);

    // Non-copyable
    RangeBackend(const RangeBackend&) = delete;
    RangeBackend& operator=(const RangeBackend&) = delete;

    // Download a freshly added transfer from byte 0. Registers this
    // backend as the transfer's resume handler.
    void start(TransferId id);

    // Continue a paused, resumable transfer from its received byte count,
    // restoring the .part backup first if the destination is gone
    void resume(TransferId id);

    // Resume handler that routes to resume(); handed to other backends
    std::shared_ptr<ResumeAction> resume_action();

    // Per-request state shared by the worker and the cancel action
    struct Job;

private:
    void launch(TransferId id, const std::string& url, const std::string& destination,
                uint64_t offset, bool ranged);
    void run(const std::shared_ptr<Job>& job);
    void finish(const std::shared_ptr<Job>& job, const FetchResult& result,
                const std::string& error);

    TransferRegistry& registry_;
    Dispatcher& dispatcher_;
    HttpSession& http_;
    ThreadPool& pool_;
    TransferConfig config_;
};

} // namespace dlkeeper
