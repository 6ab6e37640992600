// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QList>
#include <QtCore/QPoint>
#include <QtWidgets/QTabWidget>

QT_BEGIN_NAMESPACE
class QToolButton;
QT_END_NAMESPACE

namespace Docking {

class DockPanel;
class DockTabBar;

// Rendered form of a tab group. Reports user intents; it never edits the
// layout itself.
class DOCKING_EXPORT DockTabWidget final : public QTabWidget
{
    Q_OBJECT

public:
    explicit DockTabWidget(QWidget* parent = nullptr);

    DockTabBar* dockTabBar() const { return m_tabBar; }

    void addPanel(DockPanel* panel);
    DockPanel* panelAt(int index) const;
    int indexOfPanel(const DockPanel* panel) const;
    QList<DockPanel*> panels() const;

    void setChromeVisible(bool visible);
    bool chromeVisible() const { return m_chromeVisible; }

    QToolButton* undockGroupButton() const { return m_undockButton; }
    QToolButton* closeGroupButton() const { return m_closeButton; }

signals:
    void closePanelRequested(Docking::DockPanel* panel);
    void tearRequested(Docking::DockPanel* panel, const QPoint& globalPos);
    void nativeDragRequested(Docking::DockPanel* panel);
    void panelMoved(int from, int to);
    void undockGroupRequested();
    void closeGroupRequested();

private:
    DockTabBar* m_tabBar = nullptr;
    QWidget* m_corner = nullptr;
    QToolButton* m_undockButton = nullptr;
    QToolButton* m_closeButton = nullptr;
    bool m_chromeVisible = true;
};

} // namespace Docking
