/*
 * src/gui/main_window_qt.cpp - Main window for the Qt GUI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "main_window_qt.h"
#include <QDateTime>
#include <QDir>
#include <QFileDialog>
#include <QScrollArea>
#include <QScrollBar>
#include <QSettings>
#include <QStandardPaths>
#include <QStatusBar>
#include <stdexcept>

#include "dlkeeper/log.h"

namespace dlkeeper {

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , config_(make_default_config())
    , cookies_(std::make_shared<CookieJar>())
{
    setWindowTitle("dlkeeper");
    resize(1100, 800);

    loadSettings();

    // Route library logging into the log pane
    set_log_sink([this](LogLevel level, const std::string& message) {
        appendLog(QString("%1: %2").arg(level_to_string(level), QString::fromStdString(message)));
    });

    dispatcher_ = std::make_unique<QtDispatcher>(this);
    http_ = std::make_unique<CurlSession>(config_);
    http_->set_cookie_jar(cookies_);
    pool_ = std::make_unique<ThreadPool>(WORKER_THREADS);
    chooser_ = std::make_unique<FileDialogChooser>(this);
    rangeBackend_ = std::make_unique<RangeBackend>(registry_, *dispatcher_, *http_, *pool_, config_);
    adapter_ = std::make_unique<NativeDownloadAdapter>(registry_, intents_, *chooser_,
                                                      *rangeBackend_, config_);

    setupUi();

    connect(browserWidget_->profile(), &QWebEngineProfile::downloadRequested,
            this, &MainWindow::onDownloadRequested);

    // Log flush timer for batched log updates
    logFlushTimer_ = new QTimer(this);
    logFlushTimer_->setTimerType(Qt::CoarseTimer);
    connect(logFlushTimer_, &QTimer::timeout, this, &MainWindow::flushPendingLogs);
    logFlushTimer_->start(LOG_FLUSH_INTERVAL_MS);

    statusBar()->showMessage("Downloads go to " + QString::fromStdString(config_.download_dir));
}

MainWindow::~MainWindow() {
    // Workers post back into this window; stop them before anything else goes
    pool_->shutdown();
    set_log_sink(nullptr);

    // The view unsubscribes from the registry, which dies before child widgets
    delete downloadsView_;
    downloadsView_ = nullptr;
}

void MainWindow::setupUi() {
    splitter_ = new QSplitter(Qt::Vertical, this);
    setCentralWidget(splitter_);

    browserWidget_ = new BrowserWidget(cookies_);
    connect(browserWidget_, &BrowserWidget::saveLinkRequested,
            this, &MainWindow::onSaveLinkRequested);
    splitter_->addWidget(browserWidget_);

    bottomTabs_ = new QTabWidget();

    // Downloads tab
    QWidget* downloadsTab = new QWidget();
    QVBoxLayout* downloadsLayout = new QVBoxLayout(downloadsTab);
    downloadsLayout->setContentsMargins(6, 6, 6, 6);

    // Download folder selector
    QHBoxLayout* folderLayout = new QHBoxLayout();
    folderLayout->addWidget(new QLabel("Download Folder:"));
    downloadPathEdit_ = new QLineEdit(QString::fromStdString(config_.download_dir));
    downloadPathEdit_->setReadOnly(true);
    folderLayout->addWidget(downloadPathEdit_);
    browseButton_ = new QPushButton("Browse...");
    connect(browseButton_, &QPushButton::clicked, this, &MainWindow::onBrowseClicked);
    folderLayout->addWidget(browseButton_);
    downloadsLayout->addLayout(folderLayout);

    downloadsView_ = new DownloadsView(registry_, config_.list_limit);
    connect(downloadsView_, &DownloadsView::activeCountChanged,
            this, &MainWindow::onActiveCountChanged);
    QScrollArea* scroll = new QScrollArea();
    scroll->setWidgetResizable(true);
    scroll->setWidget(downloadsView_);
    downloadsLayout->addWidget(scroll, 1);

    bottomTabs_->addTab(downloadsTab, "Downloads");

    // Log tab
    logView_ = new QPlainTextEdit();
    logView_->setReadOnly(true);
    logView_->setMaximumBlockCount(MAX_LOG_LINES);
    logView_->setStyleSheet("font-family: monospace;");
    bottomTabs_->addTab(logView_, "Log");

    splitter_->addWidget(bottomTabs_);
    splitter_->setStretchFactor(0, 3);
    splitter_->setStretchFactor(1, 1);
}

void MainWindow::openUrl(const QString& url) {
    browserWidget_->navigateTo(url);
}

void MainWindow::onDownloadRequested(QWebEngineDownloadRequest* request) {
    auto download = std::make_shared<WebEngineDownload>(request);
    std::shared_ptr<NativeTransfer> transfer = adapter_->track(download);

    // Handlers live as long as the request does
    connect(request, &QWebEngineDownloadRequest::receivedBytesChanged, request, [transfer]() {
        transfer->on_received_data();
    });
    connect(request, &QWebEngineDownloadRequest::totalBytesChanged, request, [transfer]() {
        transfer->on_received_data();
    });
    connect(request, &QWebEngineDownloadRequest::stateChanged, request,
            [transfer, request](QWebEngineDownloadRequest::DownloadState state) {
        switch (state) {
            case QWebEngineDownloadRequest::DownloadCompleted:
                transfer->on_finished();
                break;
            case QWebEngineDownloadRequest::DownloadInterrupted:
                transfer->on_failed(request->interruptReasonString().toStdString());
                break;
            case QWebEngineDownloadRequest::DownloadCancelled:
                transfer->on_failed("Download cancelled");
                break;
            default:
                break;
        }
    });

    // Must be decided before this slot returns; the chooser is modal
    transfer->on_decide_destination(request->suggestedFileName().toStdString());

    if (transfer->id()) {
        saveSettings();
        checkRanges(download, transfer);
    }
}

void MainWindow::checkRanges(const std::shared_ptr<WebEngineDownload>& download,
                             const std::shared_ptr<NativeTransfer>& transfer) {
    std::string url = download->source_url();
    std::weak_ptr<NativeTransfer> weakTransfer = transfer;

    try {
        pool_->submit([this, url, download, weakTransfer]() {
            HeadResult result = http_->head(url);
            dispatcher_->post([download, weakTransfer, result]() {
                download->set_head_result(result);
                if (auto transfer = weakTransfer.lock()) {
                    transfer->on_received_data();
                }
            });
        });
    } catch (const std::runtime_error& e) {
        appendLog(QString("Cannot check ranges for %1: %2").arg(QString::fromStdString(url), e.what()));
    }
}

void MainWindow::onSaveLinkRequested(const QUrl& url) {
    intents_.mark(url.toString().toStdString());
    browserWidget_->downloadUrl(url);
}

void MainWindow::onBrowseClicked() {
    QString dir = QFileDialog::getExistingDirectory(this, "Select Download Folder",
                                                     downloadPathEdit_->text(),
                                                     QFileDialog::ShowDirsOnly);
    if (!dir.isEmpty()) {
        downloadPathEdit_->setText(dir);
        config_.download_dir = dir.toStdString();
        adapter_->set_download_dir(config_.download_dir);
        saveSettings();
    }
}

void MainWindow::onActiveCountChanged(int active) {
    if (active > 0) {
        statusBar()->showMessage(QString("%1 download(s) in progress").arg(active));
    } else {
        statusBar()->showMessage("Downloads go to " + QString::fromStdString(config_.download_dir));
    }
}

void MainWindow::stopTransfers() {
    for (const auto& transfer : registry_.list(registry_.size())) {
        if (!transfer.is_active()) continue;
        if (transfer.supports_resume) {
            registry_.pause(transfer.id);
        } else {
            registry_.cancel(transfer.id);
        }
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (registry_.has_active()) {
        appendLog("Closing with active downloads, stopping them");
        stopTransfers();
    }
    saveSettings();
    event->accept();
}

void MainWindow::appendLog(const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("[HH:mm:ss] ");
    QMutexLocker locker(&logMutex_);
    pendingLogs_.append(timestamp + message);
}

void MainWindow::flushPendingLogs() {
    QStringList logs;
    {
        QMutexLocker locker(&logMutex_);
        if (pendingLogs_.isEmpty()) return;
        logs.swap(pendingLogs_);
    }

    // Batch append all logs at once
    logView_->setUpdatesEnabled(false);
    for (const QString& log : logs) {
        logView_->appendPlainText(log);
    }
    logView_->setUpdatesEnabled(true);

    QScrollBar* scrollBar = logView_->verticalScrollBar();
    scrollBar->setValue(scrollBar->maximum());
}

void MainWindow::loadSettings() {
    QSettings settings("dlkeeper", "dlkeeper");

    QString fallback = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (fallback.isEmpty()) {
        fallback = QString::fromStdString(config_.download_dir);
    }
    config_.download_dir = settings.value("downloadDir", fallback).toString().toStdString();
    QDir().mkpath(QString::fromStdString(config_.download_dir));

    intents_.set_last_directory(settings.value("lastSaveDir").toString().toStdString());
}

void MainWindow::saveSettings() {
    QSettings settings("dlkeeper", "dlkeeper");
    settings.setValue("downloadDir", QString::fromStdString(config_.download_dir));
    settings.setValue("lastSaveDir", QString::fromStdString(intents_.last_directory()));
}

} // namespace dlkeeper
