/*
 * src/gui/browser_widget.cpp - Embedded browser with download hooks
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "browser_widget.h"
#include <QAction>
#include <QMenu>
#include <QWebEngineContextMenuRequest>
#include <QWebEngineCookieStore>
#include <QWebEnginePage>

namespace dlkeeper {

BrowserView::BrowserView(QWidget* parent) : QWebEngineView(parent) {
}

void BrowserView::contextMenuEvent(QContextMenuEvent* event) {
    QMenu* menu = createStandardContextMenu();
    QWebEngineContextMenuRequest* request = lastContextMenuRequest();

    if (request && request->linkUrl().isValid()) {
        QUrl link = request->linkUrl();
        QAction* saveAs = new QAction("Save Link As...", menu);
        connect(saveAs, &QAction::triggered, this, [this, link]() {
            emit saveLinkRequested(link);
        });

        QAction* first = menu->actions().isEmpty() ? nullptr : menu->actions().first();
        menu->insertAction(first, saveAs);
        menu->insertSeparator(first);
    }

    menu->setAttribute(Qt::WA_DeleteOnClose);
    menu->popup(event->globalPos());
}

BrowserWidget::BrowserWidget(std::shared_ptr<CookieJar> cookies, QWidget* parent)
    : QWidget(parent), cookies_(std::move(cookies)) {
    setupUi();

    QWebEngineCookieStore* store = profile()->cookieStore();
    connect(store, &QWebEngineCookieStore::cookieAdded, this, &BrowserWidget::onCookieAdded);
    connect(store, &QWebEngineCookieStore::cookieRemoved, this, &BrowserWidget::onCookieRemoved);
    store->loadAllCookies();
}

void BrowserWidget::setupUi() {
    mainLayout_ = new QVBoxLayout(this);
    mainLayout_->setContentsMargins(0, 0, 0, 0);
    mainLayout_->setSpacing(4);

    navLayout_ = new QHBoxLayout();

    backButton_ = new QPushButton("<");
    backButton_->setFixedWidth(30);
    navLayout_->addWidget(backButton_);

    forwardButton_ = new QPushButton(">");
    forwardButton_->setFixedWidth(30);
    navLayout_->addWidget(forwardButton_);

    urlEdit_ = new QLineEdit();
    urlEdit_->setPlaceholderText("Enter address");
    connect(urlEdit_, &QLineEdit::returnPressed, this, &BrowserWidget::onGoClicked);
    navLayout_->addWidget(urlEdit_);

    goButton_ = new QPushButton("Go");
    connect(goButton_, &QPushButton::clicked, this, &BrowserWidget::onGoClicked);
    navLayout_->addWidget(goButton_);

    mainLayout_->addLayout(navLayout_);

    webView_ = new BrowserView();
    connect(webView_, &QWebEngineView::urlChanged, this, &BrowserWidget::onUrlChanged);
    connect(webView_, &QWebEngineView::loadFinished, this, &BrowserWidget::onLoadFinished);
    connect(webView_, &BrowserView::saveLinkRequested, this, &BrowserWidget::saveLinkRequested);
    connect(backButton_, &QPushButton::clicked, webView_, &QWebEngineView::back);
    connect(forwardButton_, &QPushButton::clicked, webView_, &QWebEngineView::forward);
    mainLayout_->addWidget(webView_, 1);

    statusLabel_ = new QLabel();
    mainLayout_->addWidget(statusLabel_);
}

void BrowserWidget::navigateTo(const QString& url) {
    QUrl target = QUrl::fromUserInput(url);
    if (!target.isValid()) {
        statusLabel_->setText("Invalid address: " + url);
        return;
    }
    urlEdit_->setText(target.toString());
    statusLabel_->setText("Loading...");
    webView_->load(target);
}

QString BrowserWidget::currentUrl() const {
    return webView_->url().toString();
}

QWebEngineProfile* BrowserWidget::profile() const {
    return webView_->page()->profile();
}

void BrowserWidget::downloadUrl(const QUrl& url) {
    webView_->page()->download(url);
}

void BrowserWidget::onGoClicked() {
    navigateTo(urlEdit_->text().trimmed());
}

void BrowserWidget::onUrlChanged(const QUrl& url) {
    urlEdit_->setText(url.toString());
}

void BrowserWidget::onLoadFinished(bool ok) {
    statusLabel_->setText(ok ? webView_->title() : "Failed to load " + currentUrl());
}

void BrowserWidget::onCookieAdded(const QNetworkCookie& cookie) {
    time_t expiry = cookie.isSessionCookie()
        ? 0 : static_cast<time_t>(cookie.expirationDate().toSecsSinceEpoch());

    cookies_->add_cookie(Cookie(cookie.name().toStdString(), cookie.value().toStdString(),
                                cookie.domain().toStdString(), cookie.path().toStdString(),
                                cookie.isSecure(), expiry));
    emit cookiesChanged();
}

void BrowserWidget::onCookieRemoved(const QNetworkCookie& cookie) {
    cookies_->remove_cookie(cookie.name().toStdString(), cookie.domain().toStdString(),
                            cookie.path().toStdString());
    emit cookiesChanged();
}

} // namespace dlkeeper
