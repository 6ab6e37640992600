// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QPointer>
#include <QtCore/QTimer>
#include <QtWidgets/QMainWindow>

namespace Docking {

class DockContainer;
class DockingManager;
class DockingUiState;

// Host window whose central widget is the persistent main dock area.
class DOCKING_EXPORT MainDockWindow final : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainDockWindow(DockingManager* manager, QWidget* parent = nullptr);
    ~MainDockWindow() override;

    DockingManager* manager() const { return m_manager.data(); }
    DockContainer* dockArea() const { return m_dockArea; }

    // Not owned. Geometry changes are saved shortly after they happen, the
    // layout when the window closes.
    void setUiState(DockingUiState* state);
    DockingUiState* uiState() const { return m_uiState; }

    Utils::Result restoreSession();
    Utils::Result saveSession();

protected:
    bool event(QEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private:
    void scheduleGeometrySave();
    void flushGeometrySave();

    QPointer<DockingManager> m_manager;
    DockContainer* m_dockArea = nullptr;
    DockingUiState* m_uiState = nullptr;
    QTimer m_geometrySaveTimer;
};

} // namespace Docking
