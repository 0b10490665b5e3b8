/*
 * src/gui/main_window_qt.h - Main window class for the Qt GUI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#ifndef DLKEEPER_MAIN_WINDOW_QT_H
#define DLKEEPER_MAIN_WINDOW_QT_H

#include <QMainWindow>
#include <QWidget>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QPlainTextEdit>
#include <QTabWidget>
#include <QSplitter>
#include <QTimer>
#include <QMutex>
#include <QStringList>
#include <QCloseEvent>
#include <QWebEngineDownloadRequest>
#include <memory>

#include "dlkeeper/config.h"
#include "dlkeeper/cookie.h"
#include "dlkeeper/http_session.h"
#include "dlkeeper/native_backend.h"
#include "dlkeeper/range_backend.h"
#include "dlkeeper/thread_pool.h"
#include "dlkeeper/transfer_registry.h"
#include "browser_widget.h"
#include "downloads_view.h"
#include "qt_bridge.h"

namespace dlkeeper {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    void openUrl(const QString& url);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onDownloadRequested(QWebEngineDownloadRequest* request);
    void onSaveLinkRequested(const QUrl& url);
    void onBrowseClicked();
    void onActiveCountChanged(int active);
    void flushPendingLogs();

private:
    void setupUi();
    void appendLog(const QString& message);
    void checkRanges(const std::shared_ptr<WebEngineDownload>& download,
                     const std::shared_ptr<NativeTransfer>& transfer);

    // Pause what can be resumed later, cancel the rest
    void stopTransfers();

    // Settings persistence
    void loadSettings();
    void saveSettings();

    // Transfer machinery; the pool is declared last so it is the first
    // thing torn down
    TransferConfig config_;
    std::shared_ptr<CookieJar> cookies_;
    TransferRegistry registry_;
    SaveAsIntents intents_;
    std::unique_ptr<QtDispatcher> dispatcher_;
    std::unique_ptr<CurlSession> http_;
    std::unique_ptr<FileDialogChooser> chooser_;
    std::unique_ptr<RangeBackend> rangeBackend_;
    std::unique_ptr<NativeDownloadAdapter> adapter_;
    std::unique_ptr<ThreadPool> pool_;

    // UI components
    QSplitter* splitter_;
    BrowserWidget* browserWidget_;
    QTabWidget* bottomTabs_;
    DownloadsView* downloadsView_;
    QLineEdit* downloadPathEdit_;
    QPushButton* browseButton_;

    // Log view - using QPlainTextEdit for performance
    QPlainTextEdit* logView_;

    // Log batching
    QTimer* logFlushTimer_;
    QMutex logMutex_;
    QStringList pendingLogs_;
    static constexpr int MAX_LOG_LINES = 500;
    static constexpr int LOG_FLUSH_INTERVAL_MS = 100;
    static constexpr size_t WORKER_THREADS = 4;
};

} // namespace dlkeeper

#endif // DLKEEPER_MAIN_WINDOW_QT_H
