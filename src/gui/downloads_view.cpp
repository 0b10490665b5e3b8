/*
 * src/gui/downloads_view.cpp - Downloads panel bound to the transfer registry
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "downloads_view.h"
#include <set>

namespace dlkeeper {

DownloadsView::DownloadsView(TransferRegistry& registry, size_t limit, QWidget* parent)
    : QWidget(parent), registry_(registry), limit_(limit) {
    setupUi();

    refreshTimer_ = new QTimer(this);
    refreshTimer_->setSingleShot(true);
    refreshTimer_->setTimerType(Qt::CoarseTimer);
    connect(refreshTimer_, &QTimer::timeout, this, &DownloadsView::refresh);

    subscription_ = registry_.subscribe([this]() { scheduleRefresh(); });
    refresh();
}

DownloadsView::~DownloadsView() {
    registry_.unsubscribe(subscription_);
}

void DownloadsView::setupUi() {
    mainLayout_ = new QVBoxLayout(this);
    mainLayout_->setContentsMargins(6, 6, 6, 6);
    mainLayout_->setSpacing(6);

    // Aggregate progress of active transfers
    QHBoxLayout* headerLayout = new QHBoxLayout();
    overallLabel_ = new QLabel("No downloads");
    headerLayout->addWidget(overallLabel_, 1);
    clearButton_ = new QPushButton("Clear finished");
    connect(clearButton_, &QPushButton::clicked, this, &DownloadsView::onClearClicked);
    headerLayout->addWidget(clearButton_);
    mainLayout_->addLayout(headerLayout);

    overallProgress_ = new QProgressBar();
    overallProgress_->setRange(0, 100);
    overallProgress_->setTextVisible(true);
    mainLayout_->addWidget(overallProgress_);

    emptyLabel_ = new QLabel("Downloads will appear here");
    emptyLabel_->setAlignment(Qt::AlignCenter);
    mainLayout_->addWidget(emptyLabel_);

    rowsLayout_ = new QVBoxLayout();
    rowsLayout_->setSpacing(4);
    mainLayout_->addLayout(rowsLayout_);
    mainLayout_->addStretch();
}

DownloadsView::Row DownloadsView::createRow(TransferId id) {
    Row row;
    row.widget = new QWidget();
    QVBoxLayout* layout = new QVBoxLayout(row.widget);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setSpacing(2);

    QHBoxLayout* top = new QHBoxLayout();
    row.nameLabel = new QLabel();
    row.nameLabel->setStyleSheet("font-weight: bold;");
    top->addWidget(row.nameLabel, 1);

    row.pauseResumeButton = new QPushButton("Pause");
    connect(row.pauseResumeButton, &QPushButton::clicked, this, [this, id]() {
        if (registry_.is_active(id)) {
            registry_.pause(id);
        } else {
            registry_.resume(id);
        }
    });
    top->addWidget(row.pauseResumeButton);

    row.cancelButton = new QPushButton("Cancel");
    connect(row.cancelButton, &QPushButton::clicked, this, [this, id]() {
        registry_.cancel(id);
    });
    top->addWidget(row.cancelButton);

    row.dismissButton = new QPushButton("Dismiss");
    connect(row.dismissButton, &QPushButton::clicked, this, [this, id]() {
        registry_.remove(id);
    });
    top->addWidget(row.dismissButton);
    layout->addLayout(top);

    row.progress = new QProgressBar();
    row.progress->setRange(0, 1000);
    row.progress->setTextVisible(false);
    row.progress->setMaximumHeight(8);
    layout->addWidget(row.progress);

    row.statusLabel = new QLabel();
    row.statusLabel->setStyleSheet("color: gray;");
    layout->addWidget(row.statusLabel);

    return row;
}

void DownloadsView::updateRow(Row& row, const Transfer& transfer) {
    row.nameLabel->setText(QString::fromStdString(transfer.filename));
    row.nameLabel->setToolTip(QString::fromStdString(transfer.destination));
    row.statusLabel->setText(QString::fromStdString(transfer.status_text()));
    row.progress->setValue(static_cast<int>(transfer.progress() * 1000.0));

    bool terminal = is_terminal(transfer.status);
    if (transfer.is_active()) {
        row.pauseResumeButton->setText("Pause");
        row.pauseResumeButton->setEnabled(true);
    } else {
        row.pauseResumeButton->setText("Resume");
        row.pauseResumeButton->setEnabled(transfer.can_resume());
    }
    row.pauseResumeButton->setVisible(!terminal);
    row.cancelButton->setVisible(!terminal);
    row.dismissButton->setVisible(!transfer.is_active());
}

void DownloadsView::scheduleRefresh() {
    if (!refreshTimer_->isActive()) {
        refreshTimer_->start(REFRESH_INTERVAL_MS);
    }
}

void DownloadsView::refresh() {
    std::vector<Transfer> transfers = registry_.list(limit_);
    std::set<TransferId> shown;

    int index = 0;
    uint64_t received = 0;
    uint64_t total = 0;
    int active = 0;

    for (const auto& transfer : transfers) {
        shown.insert(transfer.id);

        auto it = rows_.find(transfer.id);
        if (it == rows_.end()) {
            it = rows_.emplace(transfer.id, createRow(transfer.id)).first;
        }
        // Keep newest first
        rowsLayout_->removeWidget(it->second.widget);
        rowsLayout_->insertWidget(index++, it->second.widget);
        updateRow(it->second, transfer);

        if (transfer.is_active()) {
            active++;
            received += transfer.received_bytes;
            total += transfer.total_bytes;
        }
    }

    for (auto it = rows_.begin(); it != rows_.end();) {
        if (shown.count(it->first) == 0) {
            rowsLayout_->removeWidget(it->second.widget);
            it->second.widget->deleteLater();
            it = rows_.erase(it);
        } else {
            ++it;
        }
    }

    emptyLabel_->setVisible(transfers.empty());
    clearButton_->setEnabled(registry_.has_any());

    if (active == 0) {
        overallLabel_->setText(transfers.empty() ? "No downloads" : "No active downloads");
        overallProgress_->setValue(0);
    } else {
        overallLabel_->setText(QString("%1 active - %2 of %3")
            .arg(active)
            .arg(QString::fromStdString(format_bytes(received)))
            .arg(total > 0 ? QString::fromStdString(format_bytes(total)) : QString("?")));
        overallProgress_->setValue(total > 0 ? static_cast<int>(100.0 * received / total) : 0);
    }

    emit activeCountChanged(active);
}

void DownloadsView::onClearClicked() {
    registry_.clear_completed();
}

} // namespace dlkeeper
