// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <utils/Result.hpp>
#include <utils/StrongId.hpp>

#include <QtCore/QList>
#include <QtCore/QPointer>
#include <QtCore/QSharedPointer>
#include <QtCore/QVector>

#include <variant>

namespace Docking {

class DockPanel;

struct LayoutNodeIdTag final {};
using NodeId = Utils::StrongId<LayoutNodeIdTag>;

struct WidgetNode final {
    NodeId id = NodeId::create();
    QPointer<DockPanel> panel;
};

struct TabGroupNode;
struct SplitterNode;

using WidgetNodePtr = QSharedPointer<WidgetNode>;
using TabGroupNodePtr = QSharedPointer<TabGroupNode>;
using SplitterNodePtr = QSharedPointer<SplitterNode>;

// A pane is anything that can sit inside a splitter or be a window root.
// Widgets only ever live inside tab groups.
using PaneNode = std::variant<TabGroupNodePtr, SplitterNodePtr>;

struct TabGroupNode final {
    NodeId id = NodeId::create();
    QVector<WidgetNodePtr> children;
};

struct SplitterNode final {
    NodeId id = NodeId::create();
    Qt::Orientation orientation = Qt::Horizontal;
    QVector<PaneNode> children;
    QList<int> sizes;
};

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

DOCKING_EXPORT WidgetNodePtr makeWidgetNode(DockPanel* panel);
DOCKING_EXPORT TabGroupNodePtr makeTabGroup(QVector<WidgetNodePtr> children = {});
DOCKING_EXPORT SplitterNodePtr makeSplitter(Qt::Orientation orientation, QVector<PaneNode> children);

DOCKING_EXPORT NodeId paneId(const PaneNode& node);
DOCKING_EXPORT bool samePane(const PaneNode& a, const PaneNode& b);
DOCKING_EXPORT bool isNullPane(const PaneNode& node);
DOCKING_EXPORT bool isEmptyPane(const PaneNode& node);

DOCKING_EXPORT TabGroupNodePtr asTabGroup(const PaneNode& node);
DOCKING_EXPORT SplitterNodePtr asSplitter(const PaneNode& node);

// Depth first: splitter children in visual order, tabs in tab order.
DOCKING_EXPORT QVector<WidgetNodePtr> allWidgets(const PaneNode& node);
DOCKING_EXPORT QList<DockPanel*> allPanels(const PaneNode& node);

DOCKING_EXPORT TabGroupNodePtr firstTabGroup(const PaneNode& node);
DOCKING_EXPORT bool containsPane(const PaneNode& tree, const PaneNode& node);

// Splices newNode in place of oldNode, keeping sibling order. Replaces the
// tree itself when oldNode is the root.
DOCKING_EXPORT Utils::Result replaceInParent(PaneNode& tree, const PaneNode& oldNode, const PaneNode& newNode);

// Removes child at index and the matching size entry, if sizes are in sync.
DOCKING_EXPORT void removeSplitterChild(SplitterNode& splitter, int index);

DOCKING_EXPORT QString describeTree(const PaneNode& node, int indent = 0);

} // namespace Docking
