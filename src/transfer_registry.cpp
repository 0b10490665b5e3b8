/*
 * src/transfer_registry.cpp - Transfer table, state transitions and actions
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/transfer_registry.h"
#include "dlkeeper/log.h"
#include <algorithm>

namespace dlkeeper {

TransferId TransferRegistry::add(const std::string& url, const std::string& filename,
                                 const std::string& destination) {
    Transfer transfer;
    transfer.id = next_id_++;
    transfer.url = url;
    transfer.filename = filename;
    transfer.destination = destination;
    transfer.status = TransferStatus::IN_PROGRESS;
    transfer.started_at = std::chrono::system_clock::now();

    TransferId id = transfer.id;
    transfers_.push_back(std::move(transfer));
    log_info("Download added: " + filename + " (id=" + std::to_string(id) + ")");

    notify();
    return id;
}

void TransferRegistry::update_progress(TransferId id, uint64_t received, uint64_t total) {
    Transfer* transfer = find(id);
    if (!transfer || is_terminal(transfer->status)) return;

    transfer->received_bytes = received;
    transfer->total_bytes = total;
    notify();
}

void TransferRegistry::set_status(TransferId id, TransferStatus status,
                                  const std::string& error_message) {
    Transfer* transfer = find(id);
    if (!transfer) return;

    if (is_terminal(transfer->status)) {
        log_debug("Download " + std::to_string(id) + " already " +
                  status_to_string(transfer->status) + ", ignoring " +
                  status_to_string(status));
        return;
    }

    transfer->status = status;
    transfer->error_message = status == TransferStatus::FAILED ? error_message : "";

    if (status == TransferStatus::FAILED) {
        log_info("Download " + std::to_string(id) + " status: FAILED (" + error_message + ")");
    } else {
        log_info("Download " + std::to_string(id) + " status: " + status_to_string(status));
    }

    notify();
}

void TransferRegistry::set_supports_resume(TransferId id, bool supports) {
    Transfer* transfer = find(id);
    if (!transfer) return;

    transfer->supports_resume = supports;
    notify();
}

void TransferRegistry::cancel(TransferId id) {
    const Transfer* transfer = find(id);
    if (!transfer || is_terminal(transfer->status)) return;

    // Status first, so the backend's own failure/finish events see it
    set_status(id, TransferStatus::CANCELLED);
    run_cancel_action(id, TransferStatus::CANCELLED);
}

void TransferRegistry::pause(TransferId id) {
    const Transfer* transfer = find(id);
    if (!transfer || !transfer->is_active()) return;

    set_status(id, TransferStatus::PAUSED);
    run_cancel_action(id, TransferStatus::PAUSED);
}

void TransferRegistry::resume(TransferId id) {
    const Transfer* transfer = find(id);
    if (!transfer) return;

    if (!transfer->can_resume()) {
        log_debug("Download " + std::to_string(id) + " cannot be resumed");
        return;
    }

    auto it = resume_actions_.find(id);
    if (it == resume_actions_.end()) {
        log_warning("No resume handler for download " + std::to_string(id));
        return;
    }

    // Hold a reference: the action may replace itself while running
    std::shared_ptr<ResumeAction> action = it->second;
    action->resume(id);
}

void TransferRegistry::remove(TransferId id) {
    transfers_.erase(std::remove_if(transfers_.begin(), transfers_.end(),
                     [id](const Transfer& t) { return t.id == id; }),
                     transfers_.end());
    cancel_actions_.erase(id);
    resume_actions_.erase(id);
    notify();
}

void TransferRegistry::clear_completed() {
    std::vector<TransferId> dropped;
    for (const auto& transfer : transfers_) {
        if (is_terminal(transfer.status)) {
            dropped.push_back(transfer.id);
        }
    }

    for (TransferId id : dropped) {
        cancel_actions_.erase(id);
        resume_actions_.erase(id);
    }
    transfers_.erase(std::remove_if(transfers_.begin(), transfers_.end(),
                     [](const Transfer& t) { return is_terminal(t.status); }),
                     transfers_.end());

    notify();
}

std::vector<Transfer> TransferRegistry::list(size_t limit) const {
    std::vector<Transfer> result;
    for (auto it = transfers_.rbegin(); it != transfers_.rend() && result.size() < limit; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::optional<Transfer> TransferRegistry::get(TransferId id) const {
    const Transfer* transfer = find(id);
    if (!transfer) return std::nullopt;
    return *transfer;
}

bool TransferRegistry::has_active() const {
    return std::any_of(transfers_.begin(), transfers_.end(),
                       [](const Transfer& t) { return t.is_active(); });
}

bool TransferRegistry::is_active(TransferId id) const {
    const Transfer* transfer = find(id);
    return transfer && transfer->is_active();
}

bool TransferRegistry::is_paused(TransferId id) const {
    const Transfer* transfer = find(id);
    return transfer && transfer->is_paused();
}

SubscriptionId TransferRegistry::subscribe(ChangeCallback callback) {
    SubscriptionId id = next_subscription_++;
    observers_.emplace_back(id, std::move(callback));
    return id;
}

void TransferRegistry::unsubscribe(SubscriptionId id) {
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                     [id](const std::pair<SubscriptionId, ChangeCallback>& entry) {
                         return entry.first == id;
                     }),
                     observers_.end());
}

void TransferRegistry::register_cancel_action(TransferId id, std::shared_ptr<CancelAction> action) {
    cancel_actions_[id] = std::move(action);
}

void TransferRegistry::register_resume_action(TransferId id, std::shared_ptr<ResumeAction> action) {
    resume_actions_[id] = std::move(action);
}

void TransferRegistry::remove_cancel_action(TransferId id) {
    cancel_actions_.erase(id);
}

void TransferRegistry::remove_resume_action(TransferId id) {
    resume_actions_.erase(id);
}

Transfer* TransferRegistry::find(TransferId id) {
    auto it = std::find_if(transfers_.begin(), transfers_.end(),
                           [id](const Transfer& t) { return t.id == id; });
    return it == transfers_.end() ? nullptr : &*it;
}

const Transfer* TransferRegistry::find(TransferId id) const {
    auto it = std::find_if(transfers_.begin(), transfers_.end(),
                           [id](const Transfer& t) { return t.id == id; });
    return it == transfers_.end() ? nullptr : &*it;
}

void TransferRegistry::run_cancel_action(TransferId id, TransferStatus recorded) {
    auto it = cancel_actions_.find(id);
    if (it == cancel_actions_.end()) return;

    std::shared_ptr<CancelAction> action = it->second;
    action->cancel(id, recorded);
}

void TransferRegistry::notify() {
    // Copy first: observers may subscribe or mutate the registry
    std::vector<ChangeCallback> callbacks;
    callbacks.reserve(observers_.size());
    for (const auto& entry : observers_) {
        callbacks.push_back(entry.second);
    }

    for (const auto& callback : callbacks) {
        callback();
    }
}

} // namespace dlkeeper
