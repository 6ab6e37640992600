// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/model/LayoutNode.hpp"

#include <utils/Result.hpp>

#include <QtCore/QList>
#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace Docking {

class DockContainer;
class DockPanel;

struct HostInfo final {
    TabGroupNodePtr group;
    SplitterNodePtr parent;
    DockContainer* window = nullptr;
    int index = -1;

    bool isValid() const { return group && window; }
};

// Root registry: one layout tree per top-level window, in registration order.
// The rendered widgets are derived from this and rebuilt on demand.
class DOCKING_EXPORT LayoutModel final
{
public:
    TabGroupNodePtr registerRoot(DockContainer* window, DockPanel* panel);
    TabGroupNodePtr registerEmptyRoot(DockContainer* window);
    void setRoot(DockContainer* window, const PaneNode& root);
    TabGroupNodePtr resetRoot(DockContainer* window);
    bool unregisterRoot(DockContainer* window);
    void clear();

    bool contains(const DockContainer* window) const;
    std::optional<PaneNode> root(const DockContainer* window) const;
    QList<DockContainer*> windows() const;
    int rootCount() const { return m_roots.size(); }

    HostInfo findHost(const DockPanel* panel) const;
    WidgetNodePtr findWidgetNode(const DockPanel* panel) const;
    DockContainer* windowOfGroup(const TabGroupNodePtr& group) const;
    QVector<WidgetNodePtr> allWidgets() const;
    QList<DockPanel*> allPanels() const;

    // Removes the widget from its tab group. Returns the window that hosted it.
    DockContainer* removeWidget(const DockPanel* panel);

    Utils::Result replaceInParent(DockContainer* window, const PaneNode& oldNode, const PaneNode& newNode);

    // Drops widget nodes whose panel has been destroyed and roots whose window
    // has been destroyed. Returns the windows whose trees changed. dying counts
    // as destroyed: QWidget emits destroyed() before its guards are cleared.
    QList<DockContainer*> pruneDead(const QObject* dying = nullptr);

    QString dump() const;

private:
    struct RootEntry final {
        QPointer<DockContainer> window;
        DockContainer* key = nullptr;
        PaneNode root;
    };

    int indexOf(const DockContainer* window) const;

    QVector<RootEntry> m_roots;
};

} // namespace Docking
