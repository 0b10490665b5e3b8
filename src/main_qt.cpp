/*
 * src/main_qt.cpp - Main entry point for the Qt application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include <QApplication>
#include <QStringList>
#include "gui/main_window_qt.h"

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    app.setApplicationName("dlkeeper");
    app.setApplicationVersion("1.0.0");

    dlkeeper::MainWindow window;
    window.show();

    QStringList args = app.arguments();
    if (args.size() > 1) {
        window.openUrl(args.at(1));
    }

    return app.exec();
}
