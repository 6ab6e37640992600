// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QList>
#include <QtCore/QPoint>
#include <QtCore/QPointer>
#include <QtCore/QRect>
#include <QtCore/QVector>
#include <QtWidgets/QWidget>

#include <optional>

namespace Docking {

class DockContainer;
class DockPanel;
class DockTabWidget;

struct HitTestEntry final {
    enum class Kind : unsigned char {
        TabBar,
        Panel,
        Container
    };

    Kind kind = Kind::Container;
    QRect globalRect;
    QPointer<QWidget> widget;
    QPointer<DockContainer> window;
    QVector<QRect> tabRects;
    int zOrder = 0;

    DockPanel* panel() const;
    DockTabWidget* tabWidget() const;
    DockContainer* container() const { return window.data(); }
};

struct TabBarHit final {
    QPointer<DockTabWidget> tabs;
    QPointer<DockContainer> window;
    int index = -1;
};

// Point-in-time snapshot of drop candidates in screen coordinates, ordered by
// window z-order (0 is topmost). Rebuilt at drag start and invalidated on any
// visual change.
class DOCKING_EXPORT HitTestCache final
{
public:
    void build(const QList<DockContainer*>& windowStack, const DockContainer* exclude);
    void addEntry(HitTestEntry entry);
    void invalidate();

    bool isValid() const { return m_valid; }
    const QVector<HitTestEntry>& entries() const { return m_entries; }

    const HitTestEntry* findDropTargetAt(const QPoint& globalPos, const DockContainer* exclude = nullptr) const;
    std::optional<TabBarHit> findTabBarAt(const QPoint& globalPos, const DockContainer* exclude = nullptr) const;

    // -1 outside the bar; otherwise the tab slot the point falls into, split at
    // each tab's horizontal midpoint. Empty bar space maps to the tab count.
    static int insertionIndex(const QRect& barRect, const QVector<QRect>& tabRects, const QPoint& pos);

private:
    static bool livesIn(const HitTestEntry& entry, const DockContainer* exclude);

    QVector<HitTestEntry> m_entries;
    bool m_valid = false;
};

} // namespace Docking
