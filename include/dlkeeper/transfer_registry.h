/*
 * transfer_registry.h - In-memory table of transfers with observer fan-out
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

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "dlkeeper/transfer.h"

namespace dlkeeper {

// Backend hook that stops a transfer. `recorded` is the status the registry
// has already stored (PAUSED or CANCELLED), so the backend can tell a pause
// from a real cancel.
class CancelAction {
public:
    virtual ~CancelAction() = default;
    virtual void cancel(TransferId id, TransferStatus recorded) = 0;
};

// Backend hook that restarts a paused transfer
class ResumeAction {
public:
    virtual ~ResumeAction() = default;
    virtual void resume(TransferId id) = 0;
};

// Single source of truth for all transfers.
//
// Not thread-safe: every call must come from the thread that owns the
// registry. Workers reach it through a Dispatcher. No operation fails;
// ids that are unknown (dismissed, or never existed) are ignored.
class TransferRegistry {
public:
    using ChangeCallback = std::function<void()>;

    TransferRegistry() = default;

    // Non-copyable
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // Create an IN_PROGRESS transfer and return its id
    TransferId add(const std::string& url, const std::string& filename,
                   const std::string& destination);

    void update_progress(TransferId id, uint64_t received, uint64_t total);
    void set_status(TransferId id, TransferStatus status,
                    const std::string& error_message = "");
    void set_supports_resume(TransferId id, bool supports);

    // Record CANCELLED / PAUSED, then run the cancel action
    void cancel(TransferId id);
    void pause(TransferId id);

    // Run the resume action if the transfer can be resumed
    void resume(TransferId id);

    // Drop the transfer and its actions (idempotent)
    void remove(TransferId id);

    // Drop every completed, failed and cancelled transfer
    void clear_completed();

    // Most recent first
    std::vector<Transfer> list(size_t limit) const;
    std::optional<Transfer> get(TransferId id) const;

    bool has_active() const;
    bool has_any() const { return !transfers_.empty(); }
    bool is_active(TransferId id) const;
    bool is_paused(TransferId id) const;
    size_t size() const { return transfers_.size(); }

    // Observers are notified after every mutation
    SubscriptionId subscribe(ChangeCallback callback);
    void unsubscribe(SubscriptionId id);

    // At most one of each per transfer; registering again replaces
    void register_cancel_action(TransferId id, std::shared_ptr<CancelAction> action);
    void register_resume_action(TransferId id, std::shared_ptr<ResumeAction> action);
    void remove_cancel_action(TransferId id);
    void remove_resume_action(TransferId id);
    bool has_cancel_action(TransferId id) const { return cancel_actions_.count(id) > 0; }
    bool has_resume_action(TransferId id) const { return resume_actions_.count(id) > 0; }

private:
    Transfer* find(TransferId id);
    const Transfer* find(TransferId id) const;
    void run_cancel_action(TransferId id, TransferStatus recorded);
    void notify();

    std::vector<Transfer> transfers_;   // Creation order
    TransferId next_id_ = 1;

    std::vector<std::pair<SubscriptionId, ChangeCallback>> observers_;
    SubscriptionId next_subscription_ = 1;

    std::unordered_map<TransferId, std::shared_ptr<CancelAction>> cancel_actions_;
    std::unordered_map<TransferId, std::shared_ptr<ResumeAction>> resume_actions_;
};

} // namespace dlkeeper
