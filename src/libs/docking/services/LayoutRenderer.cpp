// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/services/LayoutRenderer.hpp"

#include "docking/DockingConstants.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockOverlay.hpp"
#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/DockTabBar.hpp"
#include "docking/widgets/DockTabWidget.hpp"

#include <QtCore/QStringList>
#include <QtWidgets/QSplitter>

#include <numeric>

namespace Docking {

bool tabChromeVisible(bool insideSplitter, int tabCount, bool persistentRoot)
{
    if (insideSplitter)
        return true;
    if (tabCount == 1 && !persistentRoot)
        return false;
    return true;
}

void LayoutRenderer::render(DockContainer* container, const PaneNode& root, DockPanel* activate) const
{
    if (!container)
        return;

    DockOverlay::destroyFor(container);
    for (DockPanel* panel : allPanels(root))
        DockOverlay::destroyFor(panel);

    QWidget* old = container->takeContentWidget();

    RenderRoutes routes;
    QWidget* content = buildPane(root, false, container->isPersistentRoot(), activate, routes);
    container->setContentWidget(content);
    container->setRoutes(std::move(routes));

    if (old) {
        // Anything still parented here is no longer part of this window.
        for (DockPanel* orphan : old->findChildren<DockPanel*>()) {
            DockOverlay::destroyFor(orphan);
            orphan->hide();
            orphan->setParent(nullptr);
        }
        old->hide();
        old->deleteLater();
    }

    QStringList titles;
    for (DockPanel* panel : allPanels(root))
        titles << panel->title();
    container->updateTitle(titles);
}

QWidget* LayoutRenderer::buildPane(const PaneNode& node,
                                   bool insideSplitter,
                                   bool persistentRoot,
                                   DockPanel* activate,
                                   RenderRoutes& routes) const
{
    return std::visit(Overloaded{
        [&](const TabGroupNodePtr& group) -> QWidget* {
            auto* tabs = new DockTabWidget();
            tabs->dockTabBar()->setTearThreshold(m_config.tearThresholdPx);
            tabs->dockTabBar()->setDragMode(m_config.tabDragMode);

            if (group) {
                for (const WidgetNodePtr& widget : group->children) {
                    if (!widget || !widget->panel)
                        continue;
                    DockPanel* panel = widget->panel.data();
                    DockOverlay::destroyFor(panel);
                    tabs->addPanel(panel);
                    routes.panelTabs.insert(panel, tabs);
                }
                routes.groups.insert(tabs, group);
            }

            if (activate) {
                const int index = tabs->indexOfPanel(activate);
                if (index >= 0)
                    tabs->setCurrentIndex(index);
            }
            if (QWidget* current = tabs->currentWidget())
                current->show();

            tabs->setChromeVisible(tabChromeVisible(insideSplitter, tabs->count(), persistentRoot));
            routes.tabWidgets.push_back(tabs);
            return tabs;
        },
        [&](const SplitterNodePtr& splitterNode) -> QWidget* {
            auto* splitter = new QSplitter();
            splitter->setHandleWidth(Constants::kSplitterHandleWidth);
            splitter->setChildrenCollapsible(false);
            if (!splitterNode)
                return splitter;

            splitter->setOrientation(splitterNode->orientation);
            for (const PaneNode& child : splitterNode->children)
                splitter->addWidget(buildPane(child, true, persistentRoot, activate, routes));

            const auto count = splitterNode->children.size();
            if (splitterNode->sizes.size() == count)
                splitter->setSizes(splitterNode->sizes);
            else
                splitter->setSizes(QList<int>(count, Constants::kDefaultSplitterSize));

            routes.splitters.push_back({splitter, splitterNode});
            return splitter;
        },
    }, node);
}

void LayoutRenderer::captureSplitterSizes(const DockContainer* container)
{
    if (!container)
        return;
    for (const auto& [splitter, node] : container->routes().splitters) {
        if (!splitter || !node || !splitter->isVisible())
            continue;
        const QList<int> sizes = splitter->sizes();
        if (sizes.size() != node->children.size())
            continue;
        if (std::accumulate(sizes.cbegin(), sizes.cend(), 0) <= 0)
            continue;
        node->sizes = sizes;
    }
}

} // namespace Docking
