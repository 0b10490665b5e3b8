/*
 * src/native_backend.cpp - Engine download lifecycle mapped onto the registry
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/native_backend.h"
#include "dlkeeper/log.h"
#include "dlkeeper/partial_file.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace dlkeeper {

namespace {

// Cancel for a download the user placed with the file dialog
class NativeCancelAction : public CancelAction {
public:
    explicit NativeCancelAction(std::shared_ptr<NativeDownload> download)
        : download_(std::move(download)) {}

    void cancel(TransferId /*id*/, TransferStatus /*recorded*/) override {
        download_->cancel();
    }

private:
    std::shared_ptr<NativeDownload> download_;
};

// Cancel for an auto-saved download. The engine deletes the partial file
// when cancelled, so a pause copies it aside first.
class BackupCancelAction : public CancelAction {
public:
    BackupCancelAction(std::shared_ptr<NativeDownload> download, std::string destination,
                       std::string suffix)
        : download_(std::move(download)),
          destination_(std::move(destination)),
          suffix_(std::move(suffix)) {}

    void cancel(TransferId /*id*/, TransferStatus recorded) override {
        if (recorded == TransferStatus::PAUSED) {
            backup_partial(destination_, suffix_);
        } else {
            discard_partial(destination_, suffix_);
        }
        download_->cancel();
    }

private:
    std::shared_ptr<NativeDownload> download_;
    std::string destination_;
    std::string suffix_;
};

} // namespace

void SaveAsIntents::mark(const std::string& url) {
    urls_.insert(url);
}

bool SaveAsIntents::take(const std::string& url) {
    return urls_.erase(url) > 0;
}

NativeTransfer::NativeTransfer(NativeDownloadAdapter& adapter,
                               std::shared_ptr<NativeDownload> download)
    : adapter_(adapter), download_(std::move(download)) {
}

void NativeTransfer::on_decide_destination(const std::string& suggested_filename) {
    std::string url = download_->source_url();

    if (!adapter_.intents().take(url)) {
        accept_automatic(suggested_filename);
        return;
    }

    std::string initial_dir = adapter_.intents().last_directory();
    if (initial_dir.empty()) {
        initial_dir = adapter_.config().download_dir;
    }

    auto self = shared_from_this();
    adapter_.chooser().choose(suggested_filename, initial_dir,
        [self, suggested_filename](std::optional<std::string> path) {
            if (!path || path->empty()) {
                log_info("Download save cancelled: " + suggested_filename);
                self->download_->cancel();
                return;
            }
            self->accept_chosen(suggested_filename, *path);
        });
}

void NativeTransfer::accept_chosen(const std::string& suggested_filename, const std::string& path) {
    std::string parent = fs::path(path).parent_path().string();
    if (!parent.empty()) {
        adapter_.intents().set_last_directory(parent);
    }

    TransferRegistry& registry = adapter_.registry();
    TransferId id = registry.add(download_->source_url(), suggested_filename, path);
    id_ = id;
    registry.register_cancel_action(id, std::make_shared<NativeCancelAction>(download_));

    log_info("Saving download to: " + path);
    download_->set_destination(path);
}

void NativeTransfer::accept_automatic(const std::string& suggested_filename) {
    const TransferConfig& config = adapter_.config();
    std::string destination = unique_destination(config.download_dir, suggested_filename,
                                                 config.max_name_attempts);

    TransferRegistry& registry = adapter_.registry();
    TransferId id = registry.add(download_->source_url(), file_name_of(destination), destination);
    id_ = id;
    registry.register_cancel_action(id, std::make_shared<BackupCancelAction>(
        download_, destination, config.backup_suffix));
    registry.register_resume_action(id, adapter_.range_backend().resume_action());

    log_info("Auto-saving download to: " + destination);
    download_->set_destination(destination);
}

// Once paused or cancelled the transfer no longer belongs to this download;
// a resume hands it to the range backend.
bool NativeTransfer::detached() {
    if (!detached_ && !adapter_.registry().is_active(*id_)) {
        detached_ = true;
    }
    return detached_;
}

void NativeTransfer::on_received_data() {
    if (!id_) return;

    // Headers can land after a pause and still decide whether resume is offered
    check_resume_support();
    if (detached()) return;

    adapter_.registry().update_progress(*id_, download_->received_bytes(),
                                        download_->expected_bytes());
}

void NativeTransfer::check_resume_support() {
    if (resume_checked_ || !download_->has_response()) return;
    resume_checked_ = true;

    auto accept_ranges = download_->response_header("Accept-Ranges");
    if (!accept_ranges) return;

    bool supports = accepts_ranges(*accept_ranges);
    adapter_.registry().set_supports_resume(*id_, supports);
    log_info("Download " + std::to_string(*id_) + " Accept-Ranges: " + *accept_ranges +
             " (resume=" + (supports ? "true" : "false") + ")");
}

void NativeTransfer::on_finished() {
    if (!id_) return;

    TransferRegistry& registry = adapter_.registry();
    TransferId id = *id_;
    if (detached()) return;

    uint64_t expected = download_->expected_bytes();
    uint64_t received = download_->received_bytes();

    if (expected > 0 && received < expected) {
        log_info("Download " + std::to_string(id) + " finished short (" +
                 std::to_string(received) + " of " + std::to_string(expected) + " bytes)");
        registry.set_status(id, TransferStatus::CANCELLED);
        registry.remove_cancel_action(id);
        return;
    }

    registry.update_progress(id, received, expected > 0 ? expected : received);
    registry.set_status(id, TransferStatus::COMPLETED);
    registry.remove_cancel_action(id);
    registry.remove_resume_action(id);
}

void NativeTransfer::on_failed(const std::string& message) {
    if (!id_) return;

    TransferRegistry& registry = adapter_.registry();
    TransferId id = *id_;

    // A pause also surfaces as a failure from the engine
    if (detached()) return;

    registry.set_status(id, TransferStatus::FAILED, message);
    registry.remove_cancel_action(id);
}

NativeDownloadAdapter::NativeDownloadAdapter(TransferRegistry& registry, SaveAsIntents& intents,
                                             DestinationChooser& chooser,
                                             RangeBackend& range_backend,
                                             const TransferConfig& config)
    : registry_(registry),
      intents_(intents),
      chooser_(chooser),
      range_backend_(range_backend),
      config_(config) {
}

std::shared_ptr<NativeTransfer> NativeDownloadAdapter::track(std::shared_ptr<NativeDownload> download) {
    log_debug("Engine download started: " + download->source_url());
    return std::make_shared<NativeTransfer>(*this, std::move(download));
}

} // namespace dlkeeper
