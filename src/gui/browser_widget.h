/*
 * browser_widget.h - Widget embedding QWebEngineView with download hooks
 * Copyright © 2026 Kirn Gill II <segin2005@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef DLKEEPER_BROWSER_WIDGET_H
#define DLKEEPER_BROWSER_WIDGET_H

#include <QWidget>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QPushButton>
#include <QLabel>
#include <QString>
#include <QUrl>
#include <QContextMenuEvent>
#include <QWebEngineView>
#include <QWebEngineProfile>
#include <QNetworkCookie>
#include <memory>

#include "dlkeeper/cookie.h"

namespace dlkeeper {

// Web view whose link context menu offers "Save Link As..."
class BrowserView : public QWebEngineView {
    Q_OBJECT

public:
    explicit BrowserView(QWidget* parent = nullptr);

signals:
    void saveLinkRequested(const QUrl& url);

protected:
    void contextMenuEvent(QContextMenuEvent* event) override;
};

class BrowserWidget : public QWidget {
    Q_OBJECT

public:
    BrowserWidget(std::shared_ptr<CookieJar> cookies, QWidget* parent = nullptr);
    ~BrowserWidget() override = default;

    void navigateTo(const QString& url);
    QString currentUrl() const;

    QWebEngineProfile* profile() const;

    // Start an engine download of url, as if the user clicked the link
    void downloadUrl(const QUrl& url);

signals:
    void saveLinkRequested(const QUrl& url);
    void cookiesChanged();

private slots:
    void onGoClicked();
    void onUrlChanged(const QUrl& url);
    void onLoadFinished(bool ok);
    void onCookieAdded(const QNetworkCookie& cookie);
    void onCookieRemoved(const QNetworkCookie& cookie);

private:
    void setupUi();

    QVBoxLayout* mainLayout_;
    QHBoxLayout* navLayout_;
    QLineEdit* urlEdit_;
    QPushButton* goButton_;
    QPushButton* backButton_;
    QPushButton* forwardButton_;
    QLabel* statusLabel_;
    BrowserView* webView_;

    // Browser cookies mirrored for the HTTP session
    std::shared_ptr<CookieJar> cookies_;
};

} // namespace dlkeeper

#endif // DLKEEPER_BROWSER_WIDGET_H
