// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/services/HitTestCache.hpp"

#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/DockTabBar.hpp"
#include "docking/widgets/DockTabWidget.hpp"

#include <algorithm>

namespace Docking {

namespace {

QRect globalRectOf(const QWidget* widget)
{
    return QRect(widget->mapToGlobal(QPoint(0, 0)), widget->size());
}

qint64 area(const QRect& r)
{
    return qint64(r.width()) * qint64(r.height());
}

} // namespace

DockPanel* HitTestEntry::panel() const
{
    return kind == Kind::Panel ? qobject_cast<DockPanel*>(widget.data()) : nullptr;
}

DockTabWidget* HitTestEntry::tabWidget() const
{
    return kind == Kind::TabBar ? qobject_cast<DockTabWidget*>(widget.data()) : nullptr;
}

void HitTestCache::build(const QList<DockContainer*>& windowStack, const DockContainer* exclude)
{
    m_entries.clear();

    int z = 0;
    for (DockContainer* window : windowStack) {
        if (!window || window == exclude || !window->isVisible())
            continue;

        HitTestEntry body;
        body.kind = HitTestEntry::Kind::Container;
        body.globalRect = globalRectOf(window);
        body.widget = window;
        body.window = window;
        body.zOrder = z;
        m_entries.push_back(body);

        for (const QPointer<DockTabWidget>& tabs : window->routes().tabWidgets) {
            if (!tabs || !tabs->isVisible())
                continue;

            DockTabBar* bar = tabs->dockTabBar();
            if (bar && bar->isVisible()) {
                HitTestEntry tabEntry;
                tabEntry.kind = HitTestEntry::Kind::TabBar;
                tabEntry.globalRect = globalRectOf(bar);
                tabEntry.widget = tabs.data();
                tabEntry.window = window;
                tabEntry.zOrder = z;
                const QPoint origin = bar->mapToGlobal(QPoint(0, 0));
                for (const QRect& r : bar->tabRects())
                    tabEntry.tabRects.push_back(r.translated(origin));
                m_entries.push_back(tabEntry);
            }

            for (DockPanel* panel : tabs->panels()) {
                if (!panel->isVisible())
                    continue;
                HitTestEntry panelEntry;
                panelEntry.kind = HitTestEntry::Kind::Panel;
                panelEntry.globalRect = globalRectOf(panel);
                panelEntry.widget = panel;
                panelEntry.window = window;
                panelEntry.zOrder = z;
                m_entries.push_back(panelEntry);
            }
        }
        ++z;
    }

    m_valid = true;
    qCDebug(dockingdraglog) << "Hit-test cache built with" << m_entries.size() << "entries";
}

void HitTestCache::addEntry(HitTestEntry entry)
{
    m_entries.push_back(std::move(entry));
    m_valid = true;
}

void HitTestCache::invalidate()
{
    m_entries.clear();
    m_valid = false;
}

bool HitTestCache::livesIn(const HitTestEntry& entry, const DockContainer* exclude)
{
    if (!entry.widget)
        return false;
    return !exclude || entry.window.data() != exclude;
}

const HitTestEntry* HitTestCache::findDropTargetAt(const QPoint& globalPos, const DockContainer* exclude) const
{
    const HitTestEntry* best = nullptr;
    for (const HitTestEntry& entry : m_entries) {
        if (!livesIn(entry, exclude) || !entry.globalRect.contains(globalPos))
            continue;
        if (!best) {
            best = &entry;
            continue;
        }
        if (entry.zOrder != best->zOrder) {
            if (entry.zOrder < best->zOrder)
                best = &entry;
            continue;
        }
        // Same window: tab bars beat panels beat the container body; among
        // equals the smaller region is the more specific one.
        if (entry.kind != best->kind) {
            if (entry.kind < best->kind)
                best = &entry;
            continue;
        }
        if (area(entry.globalRect) < area(best->globalRect))
            best = &entry;
    }
    return best;
}

std::optional<TabBarHit> HitTestCache::findTabBarAt(const QPoint& globalPos, const DockContainer* exclude) const
{
    const HitTestEntry* hit = findDropTargetAt(globalPos, exclude);
    if (!hit || hit->kind != HitTestEntry::Kind::TabBar)
        return std::nullopt;

    const int index = insertionIndex(hit->globalRect, hit->tabRects, globalPos);
    if (index < 0)
        return std::nullopt;

    TabBarHit out;
    out.tabs = hit->tabWidget();
    out.window = hit->window;
    out.index = index;
    if (!out.tabs)
        return std::nullopt;
    return out;
}

int HitTestCache::insertionIndex(const QRect& barRect, const QVector<QRect>& tabRects, const QPoint& pos)
{
    if (!barRect.contains(pos))
        return -1;

    for (int i = 0; i < tabRects.size(); ++i) {
        const QRect& tab = tabRects.at(i);
        if (!tab.contains(pos))
            continue;
        return pos.x() < tab.center().x() ? i : i + 1;
    }
    return static_cast<int>(tabRects.size());
}

} // namespace Docking
