// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/model/LayoutNode.hpp"

#include "docking/widgets/DockPanel.hpp"

#include <QtCore/QStringList>

namespace Docking {

using namespace Qt::StringLiterals;

namespace {

QString shortId(const NodeId& id)
{
    return id.toString().left(8);
}

bool findParent(const SplitterNodePtr& splitter, const PaneNode& node, SplitterNodePtr& parentOut, int& indexOut)
{
    for (int i = 0; i < splitter->children.size(); ++i) {
        const PaneNode& child = splitter->children.at(i);
        if (samePane(child, node)) {
            parentOut = splitter;
            indexOut = i;
            return true;
        }
        if (const auto nested = asSplitter(child)) {
            if (findParent(nested, node, parentOut, indexOut))
                return true;
        }
    }
    return false;
}

} // namespace

WidgetNodePtr makeWidgetNode(DockPanel* panel)
{
    auto node = WidgetNodePtr::create();
    node->panel = panel;
    return node;
}

TabGroupNodePtr makeTabGroup(QVector<WidgetNodePtr> children)
{
    auto node = TabGroupNodePtr::create();
    node->children = std::move(children);
    return node;
}

SplitterNodePtr makeSplitter(Qt::Orientation orientation, QVector<PaneNode> children)
{
    auto node = SplitterNodePtr::create();
    node->orientation = orientation;
    node->children = std::move(children);
    return node;
}

NodeId paneId(const PaneNode& node)
{
    return std::visit([](const auto& ptr) -> NodeId { return ptr ? ptr->id : NodeId::null(); }, node);
}

bool samePane(const PaneNode& a, const PaneNode& b)
{
    if (a.index() != b.index())
        return false;
    return std::visit(Overloaded{
        [&b](const TabGroupNodePtr& group) { return group && group == std::get<TabGroupNodePtr>(b); },
        [&b](const SplitterNodePtr& splitter) { return splitter && splitter == std::get<SplitterNodePtr>(b); },
    }, a);
}

bool isNullPane(const PaneNode& node)
{
    return std::visit([](const auto& ptr) { return ptr.isNull(); }, node);
}

bool isEmptyPane(const PaneNode& node)
{
    return std::visit([](const auto& ptr) { return !ptr || ptr->children.isEmpty(); }, node);
}

TabGroupNodePtr asTabGroup(const PaneNode& node)
{
    if (const auto* group = std::get_if<TabGroupNodePtr>(&node))
        return *group;
    return {};
}

SplitterNodePtr asSplitter(const PaneNode& node)
{
    if (const auto* splitter = std::get_if<SplitterNodePtr>(&node))
        return *splitter;
    return {};
}

QVector<WidgetNodePtr> allWidgets(const PaneNode& node)
{
    QVector<WidgetNodePtr> out;
    std::visit(Overloaded{
        [&out](const TabGroupNodePtr& group) {
            if (group)
                out += group->children;
        },
        [&out](const SplitterNodePtr& splitter) {
            if (!splitter)
                return;
            for (const PaneNode& child : splitter->children)
                out += allWidgets(child);
        },
    }, node);
    return out;
}

QList<DockPanel*> allPanels(const PaneNode& node)
{
    QList<DockPanel*> out;
    for (const WidgetNodePtr& widget : allWidgets(node)) {
        if (widget && widget->panel)
            out.push_back(widget->panel.data());
    }
    return out;
}

TabGroupNodePtr firstTabGroup(const PaneNode& node)
{
    if (const auto group = asTabGroup(node))
        return group;
    const auto splitter = asSplitter(node);
    if (!splitter)
        return {};
    for (const PaneNode& child : splitter->children) {
        if (auto group = firstTabGroup(child))
            return group;
    }
    return {};
}

bool containsPane(const PaneNode& tree, const PaneNode& node)
{
    if (samePane(tree, node))
        return true;
    const auto splitter = asSplitter(tree);
    if (!splitter)
        return false;
    for (const PaneNode& child : splitter->children) {
        if (containsPane(child, node))
            return true;
    }
    return false;
}

Utils::Result replaceInParent(PaneNode& tree, const PaneNode& oldNode, const PaneNode& newNode)
{
    if (samePane(tree, oldNode)) {
        tree = newNode;
        return Utils::Result::success();
    }

    const auto root = asSplitter(tree);
    SplitterNodePtr parent;
    int index = -1;
    if (!root || !findParent(root, oldNode, parent, index)) {
        return Utils::Result::failure(QStringLiteral("Node %1 was not found in tree %2.")
                                          .arg(shortId(paneId(oldNode)), shortId(paneId(tree))));
    }

    parent->children[index] = newNode;
    return Utils::Result::success();
}

void removeSplitterChild(SplitterNode& splitter, int index)
{
    if (index < 0 || index >= splitter.children.size())
        return;
    if (splitter.sizes.size() == splitter.children.size())
        splitter.sizes.removeAt(index);
    else
        splitter.sizes.clear();
    splitter.children.removeAt(index);
}

QString describeTree(const PaneNode& node, int indent)
{
    const QString pad(indent * 2, QLatin1Char(' '));
    return std::visit(Overloaded{
        [&](const TabGroupNodePtr& group) -> QString {
            if (!group)
                return pad + u"<null>\n"_s;
            QString out = pad + u"TabGroup %1\n"_s.arg(shortId(group->id));
            for (const WidgetNodePtr& widget : group->children) {
                const QString name = widget && widget->panel ? widget->panel->persistentId() : u"<dead>"_s;
                out += pad + u"  Widget %1 (%2)\n"_s.arg(widget ? shortId(widget->id) : u"?"_s, name);
            }
            return out;
        },
        [&](const SplitterNodePtr& splitter) -> QString {
            if (!splitter)
                return pad + u"<null>\n"_s;
            QStringList sizes;
            for (int size : splitter->sizes)
                sizes << QString::number(size);
            QString out = pad + u"Splitter %1 %2 [%3]\n"_s.arg(
                shortId(splitter->id),
                splitter->orientation == Qt::Horizontal ? u"horizontal"_s : u"vertical"_s,
                sizes.join(u", "_s));
            for (const PaneNode& child : splitter->children)
                out += describeTree(child, indent + 1);
            return out;
        },
    }, node);
}

} // namespace Docking
