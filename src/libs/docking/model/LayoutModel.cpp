// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/model/LayoutModel.hpp"

#include "docking/widgets/DockContainer.hpp"

#include <QtCore/QStringList>

namespace Docking {

using namespace Qt::StringLiterals;

namespace {

bool findInTree(const PaneNode& node, const SplitterNodePtr& parent, const DockPanel* panel, HostInfo& out)
{
    if (const auto group = asTabGroup(node)) {
        for (int i = 0; i < group->children.size(); ++i) {
            const WidgetNodePtr& widget = group->children.at(i);
            if (widget && widget->panel && widget->panel.data() == panel) {
                out.group = group;
                out.parent = parent;
                out.index = i;
                return true;
            }
        }
        return false;
    }

    const auto splitter = asSplitter(node);
    if (!splitter)
        return false;
    for (const PaneNode& child : splitter->children) {
        if (findInTree(child, splitter, panel, out))
            return true;
    }
    return false;
}

bool pruneTree(const PaneNode& node, const QObject* dying)
{
    bool changed = false;
    if (const auto group = asTabGroup(node)) {
        const auto before = group->children.size();
        group->children.removeIf([dying](const WidgetNodePtr& widget) {
            return !widget || !widget->panel || (dying && widget->panel.data() == dying);
        });
        return before != group->children.size();
    }
    if (const auto splitter = asSplitter(node)) {
        for (const PaneNode& child : splitter->children)
            changed = pruneTree(child, dying) || changed;
    }
    return changed;
}

} // namespace

int LayoutModel::indexOf(const DockContainer* window) const
{
    if (!window)
        return -1;
    for (int i = 0; i < m_roots.size(); ++i) {
        if (m_roots.at(i).key == window)
            return i;
    }
    return -1;
}

TabGroupNodePtr LayoutModel::registerRoot(DockContainer* window, DockPanel* panel)
{
    auto group = makeTabGroup({makeWidgetNode(panel)});
    setRoot(window, group);
    return group;
}

TabGroupNodePtr LayoutModel::registerEmptyRoot(DockContainer* window)
{
    auto group = makeTabGroup();
    setRoot(window, group);
    return group;
}

void LayoutModel::setRoot(DockContainer* window, const PaneNode& root)
{
    if (!window)
        return;
    const int index = indexOf(window);
    if (index >= 0) {
        m_roots[index].root = root;
        return;
    }
    m_roots.push_back(RootEntry{window, window, root});
}

TabGroupNodePtr LayoutModel::resetRoot(DockContainer* window)
{
    const int index = indexOf(window);
    if (index < 0)
        return {};
    auto group = makeTabGroup();
    m_roots[index].root = group;
    return group;
}

bool LayoutModel::unregisterRoot(DockContainer* window)
{
    const int index = indexOf(window);
    if (index < 0)
        return false;
    m_roots.removeAt(index);
    return true;
}

void LayoutModel::clear()
{
    m_roots.clear();
}

bool LayoutModel::contains(const DockContainer* window) const
{
    return indexOf(window) >= 0;
}

std::optional<PaneNode> LayoutModel::root(const DockContainer* window) const
{
    const int index = indexOf(window);
    if (index < 0)
        return std::nullopt;
    return m_roots.at(index).root;
}

QList<DockContainer*> LayoutModel::windows() const
{
    QList<DockContainer*> out;
    out.reserve(m_roots.size());
    for (const RootEntry& entry : m_roots) {
        if (entry.window)
            out.push_back(entry.window.data());
    }
    return out;
}

HostInfo LayoutModel::findHost(const DockPanel* panel) const
{
    HostInfo info;
    if (!panel)
        return info;
    for (const RootEntry& entry : m_roots) {
        if (!entry.window)
            continue;
        if (findInTree(entry.root, {}, panel, info)) {
            info.window = entry.window.data();
            return info;
        }
    }
    return HostInfo{};
}

WidgetNodePtr LayoutModel::findWidgetNode(const DockPanel* panel) const
{
    const HostInfo host = findHost(panel);
    if (!host.isValid())
        return {};
    return host.group->children.value(host.index);
}

DockContainer* LayoutModel::windowOfGroup(const TabGroupNodePtr& group) const
{
    if (!group)
        return nullptr;
    for (const RootEntry& entry : m_roots) {
        if (entry.window && containsPane(entry.root, group))
            return entry.window.data();
    }
    return nullptr;
}

QVector<WidgetNodePtr> LayoutModel::allWidgets() const
{
    QVector<WidgetNodePtr> out;
    for (const RootEntry& entry : m_roots)
        out += Docking::allWidgets(entry.root);
    return out;
}

QList<DockPanel*> LayoutModel::allPanels() const
{
    QList<DockPanel*> out;
    for (const RootEntry& entry : m_roots)
        out += Docking::allPanels(entry.root);
    return out;
}

DockContainer* LayoutModel::removeWidget(const DockPanel* panel)
{
    const HostInfo host = findHost(panel);
    if (!host.isValid())
        return nullptr;
    host.group->children.removeAt(host.index);
    return host.window;
}

Utils::Result LayoutModel::replaceInParent(DockContainer* window, const PaneNode& oldNode, const PaneNode& newNode)
{
    const int index = indexOf(window);
    if (index < 0)
        return Utils::Result::failure(QStringLiteral("Window is not registered in the layout model."));

    auto result = Docking::replaceInParent(m_roots[index].root, oldNode, newNode);
    if (!result) {
        qCCritical(dockinglog).noquote()
            << "Layout consistency error:" << result.joined(u"; "_s);
    }
    return result;
}

QList<DockContainer*> LayoutModel::pruneDead(const QObject* dying)
{
    QList<DockContainer*> changed;
    m_roots.removeIf([dying](const RootEntry& entry) {
        return entry.window.isNull() || (dying && entry.key == dying);
    });
    for (RootEntry& entry : m_roots) {
        if (pruneTree(entry.root, dying))
            changed.push_back(entry.window.data());
    }
    return changed;
}

QString LayoutModel::dump() const
{
    QString out = u"LayoutModel: %1 root(s)\n"_s.arg(m_roots.size());
    for (const RootEntry& entry : m_roots) {
        const DockContainer* window = entry.window.data();
        out += u"Window %1 [%2]%3\n"_s.arg(
            window ? window->windowTitle() : u"<destroyed>"_s,
            window ? windowKindToString(window->kind()) : u"?"_s,
            window && window->isPersistentRoot() ? u" persistent"_s : QString());
        out += describeTree(entry.root, 1);
    }
    return out;
}

} // namespace Docking
