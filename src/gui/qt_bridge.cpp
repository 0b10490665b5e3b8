/*
 * src/gui/qt_bridge.cpp - Qt implementations of the engine-facing interfaces
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "qt_bridge.h"
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QMetaObject>
#include <QUrl>
#include "dlkeeper/log.h"

namespace dlkeeper {

QtDispatcher::QtDispatcher(QObject* context) : context_(context) {
}

void QtDispatcher::post(Task task) {
    QObject* context = context_.data();
    if (!context) {
        log_debug("Dispatcher context gone, dropping task");
        return;
    }
    QMetaObject::invokeMethod(context, std::move(task), Qt::QueuedConnection);
}

WebEngineDownload::WebEngineDownload(QWebEngineDownloadRequest* request) : request_(request) {
}

std::string WebEngineDownload::source_url() const {
    return request_ ? request_->url().toString().toStdString() : std::string();
}

void WebEngineDownload::set_destination(const std::string& path) {
    if (!request_) return;

    QFileInfo info(QString::fromStdString(path));
    request_->setDownloadDirectory(info.absolutePath());
    request_->setDownloadFileName(info.fileName());
    request_->accept();
}

void WebEngineDownload::cancel() {
    if (request_ && !request_->isFinished()) {
        request_->cancel();
    }
}

uint64_t WebEngineDownload::received_bytes() const {
    return request_ ? static_cast<uint64_t>(request_->receivedBytes()) : 0;
}

uint64_t WebEngineDownload::expected_bytes() const {
    if (!request_ || request_->totalBytes() < 0) return 0;
    return static_cast<uint64_t>(request_->totalBytes());
}

std::optional<std::string> WebEngineDownload::response_header(const std::string& name) const {
    if (!headers_seen_) return std::nullopt;

    QString key = QString::fromStdString(name).toLower();
    if (key == "accept-ranges" && !headers_.accept_ranges.empty()) {
        return headers_.accept_ranges;
    }
    if (key == "content-type" && !headers_.content_type.empty()) {
        return headers_.content_type;
    }
    if (key == "content-length" && headers_.content_length >= 0) {
        return std::to_string(headers_.content_length);
    }
    return std::nullopt;
}

void WebEngineDownload::set_head_result(const HeadResult& result) {
    headers_seen_ = true;
    if (result.success) {
        headers_ = result.headers;
    } else {
        log_debug("HEAD request for " + source_url() + " failed: " + result.error_message);
    }
}

FileDialogChooser::FileDialogChooser(QWidget* parent) : parent_(parent) {
}

void FileDialogChooser::choose(const std::string& suggested_name, const std::string& initial_dir,
                               Callback done) {
    QString start = QDir(QString::fromStdString(initial_dir))
                        .filePath(QString::fromStdString(suggested_name));

    QString file = QFileDialog::getSaveFileName(parent_.data(), "Save As", start);
    if (file.isEmpty()) {
        done(std::nullopt);
    } else {
        done(file.toStdString());
    }
}

} // namespace dlkeeper
