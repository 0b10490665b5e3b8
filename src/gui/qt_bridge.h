/*
 * src/gui/qt_bridge.h - Qt implementations of the engine-facing interfaces
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#ifndef DLKEEPER_QT_BRIDGE_H
#define DLKEEPER_QT_BRIDGE_H

#include <QObject>
#include <QPointer>
#include <QWidget>
#include <QWebEngineDownloadRequest>
#include <memory>
#include <optional>
#include <string>

#include "dlkeeper/dispatcher.h"
#include "dlkeeper/http_session.h"
#include "dlkeeper/native_backend.h"

namespace dlkeeper {

// Runs tasks on the thread of `context` through its event queue.
// Tasks posted after the context is destroyed are dropped.
class QtDispatcher : public Dispatcher {
public:
    explicit QtDispatcher(QObject* context);

    void post(Task task) override;

private:
    QPointer<QObject> context_;
};

// QtWebEngine download seen through the NativeDownload interface.
// The engine does not expose response headers, so Accept-Ranges comes
// from a HEAD request recorded with set_head_result().
class WebEngineDownload : public NativeDownload {
public:
    explicit WebEngineDownload(QWebEngineDownloadRequest* request);

    std::string source_url() const override;
    void set_destination(const std::string& path) override;
    void cancel() override;

    uint64_t received_bytes() const override;
    uint64_t expected_bytes() const override;

    bool has_response() const override { return headers_seen_; }
    std::optional<std::string> response_header(const std::string& name) const override;

    void set_head_result(const HeadResult& result);

private:
    QPointer<QWebEngineDownloadRequest> request_;
    bool headers_seen_ = false;
    ResponseHeaders headers_;
};

// Modal "Save As" dialog
class FileDialogChooser : public DestinationChooser {
public:
    explicit FileDialogChooser(QWidget* parent);

    void choose(const std::string& suggested_name, const std::string& initial_dir,
                Callback done) override;

private:
    QPointer<QWidget> parent_;
};

} // namespace dlkeeper

#endif // DLKEEPER_QT_BRIDGE_H
