/*
 * src/range_backend.cpp - HTTP range resume pipeline
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/range_backend.h"
#include "dlkeeper/log.h"
#include "dlkeeper/partial_file.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace dlkeeper {

struct RangeBackend::Job {
    TransferId id = 0;
    std::string url;
    std::string destination;
    uint64_t offset = 0;
    bool ranged = false;        // Resume request with a Range header
    std::string backup_suffix;
    std::shared_ptr<CancelToken> token = std::make_shared<CancelToken>();

    // Held while the file is opened, written or closed
    std::mutex file_mutex;
    std::ofstream file;
};

namespace {

// Stops the request. A pause keeps a copy of what has been written; a
// cancel drops any copy left by an earlier pause.
class RangeCancelAction : public CancelAction {
public:
    explicit RangeCancelAction(std::shared_ptr<RangeBackend::Job> job) : job_(std::move(job)) {}

    void cancel(TransferId id, TransferStatus recorded) override {
        log_info("Cancelling range download " + std::to_string(id));
        job_->token->cancel();

        // Wait out a chunk that is being written right now
        std::lock_guard<std::mutex> lock(job_->file_mutex);
        if (job_->file.is_open()) {
            job_->file.flush();
        }
        if (recorded == TransferStatus::PAUSED) {
            backup_partial(job_->destination, job_->backup_suffix);
        } else {
            discard_partial(job_->destination, job_->backup_suffix);
        }
    }

private:
    std::shared_ptr<RangeBackend::Job> job_;
};

class RangeResumeAction : public ResumeAction {
public:
    explicit RangeResumeAction(RangeBackend& backend) : backend_(backend) {}

    void resume(TransferId id) override {
        backend_.resume(id);
    }

private:
    RangeBackend& backend_;
};

// Writes the streamed body into the destination file
class RangeWriter : public FetchHandler {
public:
    RangeWriter(RangeBackend::Job& job, TransferRegistry& registry, Dispatcher& dispatcher)
        : job_(job), registry_(registry), dispatcher_(dispatcher) {}

    bool on_response(int http_code, const ResponseHeaders& headers) override {
        std::lock_guard<std::mutex> lock(job_.file_mutex);
        if (job_.token->is_cancelled()) return false;

        int64_t content_length = headers.content_length;
        std::ios::openmode mode = std::ios::binary;

        if (http_code == 206) {
            // Appending is only correct onto exactly the bytes already counted
            auto on_disk = existing_file_size(job_.destination);
            if (!on_disk) {
                error_ = "Partial file missing: " + job_.destination;
                return false;
            }
            if (*on_disk != job_.offset) {
                error_ = "Partial file size mismatch: expected " + std::to_string(job_.offset) +
                         " bytes, found " + std::to_string(*on_disk);
                return false;
            }

            // Server honored the range; content length is what remains
            received_ = job_.offset;
            total_ = content_length >= 0 ? job_.offset + static_cast<uint64_t>(content_length) : 0;
            mode |= std::ios::app;
        } else if (http_code == 200) {
            // Whole entity from byte 0
            if (job_.ranged) {
                log_info("Server ignored range for download " + std::to_string(job_.id) +
                         ", restarting from byte 0");
            }
            received_ = 0;
            total_ = content_length >= 0 ? static_cast<uint64_t>(content_length) : 0;
            mode |= std::ios::trunc;
        } else {
            error_ = "Server returned status " + std::to_string(http_code);
            return false;
        }

        job_.file.open(job_.destination, mode);
        if (!job_.file) {
            error_ = "Failed to open file for writing: " + job_.destination;
            return false;
        }

        post_progress();

        if (!job_.ranged && accepts_ranges(headers.accept_ranges)) {
            TransferId id = job_.id;
            TransferRegistry& registry = registry_;
            std::string value = headers.accept_ranges;
            dispatcher_.post([&registry, id, value]() {
                registry.set_supports_resume(id, true);
                log_info("Download " + std::to_string(id) + " Accept-Ranges: " + value);
            });
        }
        return true;
    }

    bool on_chunk(const char* data, size_t length) override {
        std::lock_guard<std::mutex> lock(job_.file_mutex);
        if (job_.token->is_cancelled()) return false;

        job_.file.write(data, static_cast<std::streamsize>(length));
        job_.file.flush();
        if (!job_.file.good()) {
            error_ = std::string("Write error: ") + std::strerror(errno);
            return false;
        }

        received_ += length;
        post_progress();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(job_.file_mutex);
        if (job_.file.is_open()) {
            job_.file.close();
        }
    }

    // Total unknown: report what arrived as the final size
    void settle_total() {
        if (total_ == 0 && received_ > 0) {
            total_ = received_;
            post_progress();
        }
    }

    const std::string& error() const { return error_; }

private:
    void post_progress() {
        TransferId id = job_.id;
        uint64_t received = received_;
        uint64_t total = total_;
        TransferRegistry& registry = registry_;
        dispatcher_.post([&registry, id, received, total]() {
            registry.update_progress(id, received, total);
        });
    }

    RangeBackend::Job& job_;
    TransferRegistry& registry_;
    Dispatcher& dispatcher_;
    uint64_t received_ = 0;
    uint64_t total_ = 0;
    std::string error_;
};

} // namespace

RangeBackend::RangeBackend(TransferRegistry& registry, Dispatcher& dispatcher, HttpSession& http,
                           ThreadPool& pool, const TransferConfig& config)
    : registry_(registry), dispatcher_(dispatcher), http_(http), pool_(pool), config_(config) {
}

std::shared_ptr<ResumeAction> RangeBackend::resume_action() {
    return std::make_shared<RangeResumeAction>(*this);
}

void RangeBackend::start(TransferId id) {
    auto transfer = registry_.get(id);
    if (!transfer || !transfer->is_active()) {
        log_debug("Download " + std::to_string(id) + " is not active, not starting");
        return;
    }

    registry_.register_resume_action(id, resume_action());
    launch(id, transfer->url, transfer->destination, 0, false);
}

void RangeBackend::resume(TransferId id) {
    auto transfer = registry_.get(id);
    if (!transfer || !transfer->can_resume()) {
        log_debug("Download " + std::to_string(id) + " is not resumable");
        return;
    }

    // The engine deletes the partial file on cancel; bring back the copy
    std::string error;
    if (!restore_partial(transfer->destination, error, config_.backup_suffix)) {
        registry_.set_status(id, TransferStatus::FAILED, error);
        return;
    }
    if (transfer->received_bytes > 0 && !existing_file_size(transfer->destination)) {
        // No backup and no file: the bytes already counted are gone
        registry_.set_status(id, TransferStatus::FAILED,
                             "Partial file missing: " + transfer->destination);
        return;
    }

    log_info("Resuming download " + std::to_string(id) + " from byte " +
             std::to_string(transfer->received_bytes));
    launch(id, transfer->url, transfer->destination, transfer->received_bytes, true);
}

void RangeBackend::launch(TransferId id, const std::string& url, const std::string& destination,
                          uint64_t offset, bool ranged) {
    auto job = std::make_shared<Job>();
    job->id = id;
    job->url = url;
    job->destination = destination;
    job->offset = offset;
    job->ranged = ranged;
    job->backup_suffix = config_.backup_suffix;

    // Supersede whatever cancel handler the previous backend installed
    registry_.register_cancel_action(id, std::make_shared<RangeCancelAction>(job));
    registry_.set_status(id, TransferStatus::IN_PROGRESS);

    try {
        pool_.submit([this, job]() { run(job); });
    } catch (const std::runtime_error& e) {
        registry_.set_status(id, TransferStatus::FAILED, e.what());
    }
}

void RangeBackend::run(const std::shared_ptr<Job>& job) {
    FetchRequest request;
    request.url = job->url;
    request.cancel = job->token;
    if (job->ranged) {
        request.range_start = job->offset;
    }

    RangeWriter writer(*job, registry_, dispatcher_);
    FetchResult result;
    try {
        result = http_.fetch(request, writer);
    } catch (const std::exception& e) {
        // Reported as a failed fetch so finish() still runs
        result = FetchResult{};
        result.error_message = e.what();
    } catch (...) {
        result = FetchResult{};
        result.error_message = "Unknown error during transfer";
    }
    writer.close();

    if (result.success && writer.error().empty()) {
        writer.settle_total();
    }

    std::string error = writer.error().empty() ? result.error_message : writer.error();
    dispatcher_.post([this, job, result, error]() { finish(job, result, error); });
}

void RangeBackend::finish(const std::shared_ptr<Job>& job, const FetchResult& result,
                          const std::string& error) {
    TransferId id = job->id;

    if (result.cancelled || job->token->is_cancelled()) {
        // Pause/cancel already recorded the authoritative status
        log_info("Download " + std::to_string(id) + " cancelled during read loop");
        return;
    }

    if (!registry_.is_active(id)) {
        return;
    }

    if (result.success && error.empty()) {
        log_info("Download " + std::to_string(id) + " completed");
        registry_.set_status(id, TransferStatus::COMPLETED);
        registry_.remove_cancel_action(id);
        registry_.remove_resume_action(id);
        discard_partial(job->destination, job->backup_suffix);
    } else {
        log_error("Resume download " + std::to_string(id) + " failed: " + error);
        registry_.set_status(id, TransferStatus::FAILED, error);
    }
}

} // namespace dlkeeper
