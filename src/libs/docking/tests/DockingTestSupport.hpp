// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QCoreApplication>
#include <QtCore/QEvent>
#include <QtCore/QString>
#include <QtWidgets/QApplication>
#include <QtWidgets/QLabel>

namespace DockingTests {

// Shared by every test file in the docking test binary.
inline QApplication* ensureApp()
{
    static QApplication* app = []() {
        static int argc = 1;
        static char arg0[] = "docking-tests";
        static char* argv[] = { arg0, nullptr };
        return new QApplication(argc, argv);
    }();
    return app;
}

inline QWidget* makeContent(const QString& title)
{
    auto* label = new QLabel(title);
    label->setWindowTitle(title);
    return label;
}

// Runs queued reconciles and deleteLater() calls.
inline void flushEvents()
{
    QCoreApplication::processEvents();
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    QCoreApplication::processEvents();
}

} // namespace DockingTests
