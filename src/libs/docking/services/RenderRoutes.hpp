// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/model/LayoutNode.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QPair>
#include <QtCore/QPointer>
#include <QtCore/QVector>

QT_BEGIN_NAMESPACE
class QSplitter;
QT_END_NAMESPACE

namespace Docking {

class DockPanel;
class DockTabWidget;

// Built by the renderer for one container and replaced on every render.
// Maps rendered widgets back to their model nodes without walking widgets.
struct RenderRoutes final {
    QList<QPointer<DockTabWidget>> tabWidgets;
    QHash<const DockTabWidget*, TabGroupNodePtr> groups;
    QHash<const DockPanel*, QPointer<DockTabWidget>> panelTabs;
    QVector<QPair<QPointer<QSplitter>, SplitterNodePtr>> splitters;

    TabGroupNodePtr groupFor(const DockTabWidget* tabs) const { return groups.value(tabs); }
    DockTabWidget* tabsFor(const DockPanel* panel) const { return panelTabs.value(panel).data(); }

    void clear()
    {
        tabWidgets.clear();
        groups.clear();
        panelTabs.clear();
        splitters.clear();
    }
};

} // namespace Docking
