// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"
#include "docking/services/HitTestCache.hpp"
#include "docking/widgets/DockOverlay.hpp"

#include <QtCore/QList>
#include <QtCore/QPoint>
#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

namespace Docking {

class DockContainer;
class DockPanel;
class DockTabWidget;
class LayoutModel;

struct PendingDrop final {
    enum class Kind : unsigned char {
        None,
        TabInsert,
        Dock
    };

    Kind kind = Kind::None;

    QPointer<DockTabWidget> tabs;
    int index = -1;

    // DockPanel or DockContainer.
    QPointer<QWidget> target;
    DockLocation location = DockLocation::Center;

    bool isValid() const
    {
        if (kind == Kind::TabInsert)
            return tabs && index >= 0;
        if (kind == Kind::Dock)
            return !target.isNull();
        return false;
    }
};

struct DragSource final {
    QPointer<DockContainer> window;
    QPointer<DockPanel> panel;
    // Window excluded from hit-testing, usually the one being dragged.
    QPointer<DockContainer> exclude;
    bool simple = false;
};

// Live part of a drag: hit-testing, overlays and the pending drop. Knows
// nothing about committing the drop.
class DOCKING_EXPORT DockDragController final
{
public:
    explicit DockDragController(const LayoutModel* model);

    void setMetrics(const OverlayMetrics& metrics) { m_metrics = metrics; }

    void begin(const DragSource& source, const QList<DockContainer*>& windowStack);
    void update(const QPoint& globalPos);
    PendingDrop finish();
    void cancel();

    bool isActive() const noexcept { return m_active; }
    const DragSource& source() const noexcept { return m_source; }
    const PendingDrop& pending() const noexcept { return m_pending; }
    QList<QWidget*> shownOverlayOwners() const;

    HitTestCache& cache() { return m_cache; }
    const HitTestCache& cache() const { return m_cache; }

    bool isSimpleWindow(const DockContainer* window) const;
    bool isEmptyPersistentRoot(const DockContainer* window) const;

private:
    struct OverlayRequest final {
        QWidget* owner = nullptr;
        OverlayStyle style = OverlayStyle::Cluster;
        OverlayPreset preset = OverlayPreset::Standard;
    };

    void applyOverlays(const QList<OverlayRequest>& wanted);
    void setTabIndicator(DockTabWidget* tabs, int index);
    void tearDown();

    const LayoutModel* m_model = nullptr;
    OverlayMetrics m_metrics;

    bool m_active = false;
    DragSource m_source;
    QList<QPointer<DockContainer>> m_stack;
    HitTestCache m_cache;

    QList<QPointer<QWidget>> m_shown;
    QList<QPointer<QWidget>> m_touched;
    QPointer<DockTabWidget> m_indicatorTabs;
    PendingDrop m_pending;
};

} // namespace Docking
