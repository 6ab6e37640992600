// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/widgets/MainDockWindow.hpp"

#include "docking/DockingConstants.hpp"
#include "docking/DockingManager.hpp"
#include "docking/state/DockingUiState.hpp"
#include "docking/widgets/DockContainer.hpp"

#include <QtGui/QCloseEvent>
#include <QtGui/QGuiApplication>

namespace Docking {

MainDockWindow::MainDockWindow(DockingManager* manager, QWidget* parent)
    : QMainWindow(parent)
    , m_manager(manager)
{
    setObjectName(QStringLiteral("MainDockWindow"));
    setWindowTitle(QGuiApplication::applicationDisplayName());
    resize(Constants::kDefaultMainWindowWidth, Constants::kDefaultMainWindowHeight);

    m_geometrySaveTimer.setSingleShot(true);
    m_geometrySaveTimer.setInterval(Constants::kSessionSaveDelayMs);
    connect(&m_geometrySaveTimer, &QTimer::timeout, this, &MainDockWindow::flushGeometrySave);

    m_dockArea = new DockContainer(manager, WindowKind::MainDockArea, this);
    m_dockArea->setObjectName(QStringLiteral("MainDockArea"));
    setCentralWidget(m_dockArea);

    if (!m_manager) {
        qCWarning(dockinglog) << "MainDockWindow created without a docking manager";
        return;
    }

    const Utils::Result registered = m_manager->registerDockArea(m_dockArea);
    if (!registered)
        qCCritical(dockinglog).noquote() << "Registering the main dock area failed:" << registered.joined(QStringLiteral("; "));
}

MainDockWindow::~MainDockWindow()
{
    m_geometrySaveTimer.stop();
    if (m_manager && m_manager->model().contains(m_dockArea)) {
        const Utils::Result removed = m_manager->unregisterDockArea(m_dockArea);
        if (!removed)
            qCWarning(dockinglog).noquote() << removed.joined(QStringLiteral("; "));
    }
}

void MainDockWindow::setUiState(DockingUiState* state)
{
    m_uiState = state;
}

Utils::Result MainDockWindow::restoreSession()
{
    if (!m_uiState)
        return Utils::Result::failure(QStringLiteral("No UI state attached to the main window."));

    const QByteArray geometry = m_uiState->mainWindowGeometry();
    if (!geometry.isEmpty() && !restoreGeometry(geometry))
        qCWarning(dockinglog) << "Stored main window geometry could not be applied";

    if (!m_manager || !m_uiState->hasSavedLayout())
        return Utils::Result::success();
    return m_uiState->restoreLayout(*m_manager);
}

Utils::Result MainDockWindow::saveSession()
{
    if (!m_uiState)
        return Utils::Result::failure(QStringLiteral("No UI state attached to the main window."));

    flushGeometrySave();
    if (!m_manager)
        return Utils::Result::success();
    return m_uiState->saveLayout(*m_manager);
}

bool MainDockWindow::event(QEvent* event)
{
    switch (event->type()) {
        case QEvent::Resize:
        case QEvent::Move:
        case QEvent::WindowStateChange:
            scheduleGeometrySave();
            break;
        default:
            break;
    }
    return QMainWindow::event(event);
}

void MainDockWindow::closeEvent(QCloseEvent* event)
{
    if (m_uiState) {
        const Utils::Result saved = saveSession();
        if (!saved)
            qCWarning(dockingpersistlog).noquote() << saved.joined(QStringLiteral("; "));
    }
    QMainWindow::closeEvent(event);
}

void MainDockWindow::scheduleGeometrySave()
{
    if (!m_uiState || windowState().testFlag(Qt::WindowMinimized))
        return;
    m_geometrySaveTimer.start();
}

void MainDockWindow::flushGeometrySave()
{
    m_geometrySaveTimer.stop();
    if (!m_uiState || windowState().testFlag(Qt::WindowMinimized))
        return;
    m_uiState->setMainWindowGeometry(saveGeometry());
}

} // namespace Docking
