/*
 * src/gui/downloads_view.h - Downloads panel bound to the transfer registry
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#ifndef DLKEEPER_DOWNLOADS_VIEW_H
#define DLKEEPER_DOWNLOADS_VIEW_H

#include <QWidget>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QProgressBar>
#include <QPushButton>
#include <QTimer>
#include <map>

#include "dlkeeper/transfer_registry.h"

namespace dlkeeper {

class DownloadsView : public QWidget {
    Q_OBJECT

public:
    DownloadsView(TransferRegistry& registry, size_t limit, QWidget* parent = nullptr);
    ~DownloadsView() override;

signals:
    void activeCountChanged(int active);

private slots:
    void refresh();
    void onClearClicked();

private:
    struct Row {
        QWidget* widget = nullptr;
        QLabel* nameLabel = nullptr;
        QLabel* statusLabel = nullptr;
        QProgressBar* progress = nullptr;
        QPushButton* pauseResumeButton = nullptr;
        QPushButton* cancelButton = nullptr;
        QPushButton* dismissButton = nullptr;
    };

    void setupUi();
    Row createRow(TransferId id);
    void updateRow(Row& row, const Transfer& transfer);
    void scheduleRefresh();

    TransferRegistry& registry_;
    size_t limit_;
    SubscriptionId subscription_ = 0;

    QVBoxLayout* mainLayout_;
    QVBoxLayout* rowsLayout_;
    QLabel* emptyLabel_;
    QProgressBar* overallProgress_;
    QLabel* overallLabel_;
    QPushButton* clearButton_;

    std::map<TransferId, Row> rows_;

    // Registry changes arrive per chunk; repaint at most this often
    QTimer* refreshTimer_;
    static constexpr int REFRESH_INTERVAL_MS = 100;
};

} // namespace dlkeeper

#endif // DLKEEPER_DOWNLOADS_VIEW_H
