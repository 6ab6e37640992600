// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/model/LayoutSimplifier.hpp"

namespace Docking {

namespace {

SimplifyStep simplifySplitter(const SplitterNodePtr& splitter)
{
    for (int i = 0; i < splitter->children.size(); ++i) {
        if (isEmptyPane(splitter->children.at(i)) || isNullPane(splitter->children.at(i))) {
            removeSplitterChild(*splitter, i);
            return SimplifyStep::DroppedEmptyPane;
        }
    }

    for (int i = 0; i < splitter->children.size(); ++i) {
        const auto nested = asSplitter(splitter->children.at(i));
        if (!nested)
            continue;
        if (nested->children.size() == 1) {
            splitter->children[i] = nested->children.constFirst();
            return SimplifyStep::PromotedSoleChild;
        }
        const SimplifyStep step = simplifySplitter(nested);
        if (step != SimplifyStep::None)
            return step;
    }
    return SimplifyStep::None;
}

bool validPane(const PaneNode& node, bool isRoot, bool persistentRoot)
{
    if (const auto group = asTabGroup(node))
        return !group->children.isEmpty() || (isRoot && persistentRoot);
    const auto splitter = asSplitter(node);
    if (!splitter || splitter->children.size() < 2)
        return false;
    for (const PaneNode& child : splitter->children) {
        if (!validPane(child, false, persistentRoot))
            return false;
    }
    return true;
}

} // namespace

SimplifyStep simplifyOnce(PaneNode& root, bool persistentRoot)
{
    if (isNullPane(root))
        return SimplifyStep::RootEmpty;

    if (const auto group = asTabGroup(root)) {
        if (group->children.isEmpty() && !persistentRoot)
            return SimplifyStep::RootEmpty;
        return SimplifyStep::None;
    }

    const auto splitter = asSplitter(root);
    if (splitter->children.isEmpty())
        return SimplifyStep::RootEmpty;
    if (splitter->children.size() == 1) {
        root = splitter->children.constFirst();
        return SimplifyStep::PromotedSoleChild;
    }
    return simplifySplitter(splitter);
}

int simplify(PaneNode& root, bool persistentRoot, bool* rootEmptyOut)
{
    if (rootEmptyOut)
        *rootEmptyOut = false;

    int changes = 0;
    for (;;) {
        const SimplifyStep step = simplifyOnce(root, persistentRoot);
        if (step == SimplifyStep::None)
            return changes;
        if (step == SimplifyStep::RootEmpty) {
            if (rootEmptyOut)
                *rootEmptyOut = true;
            return changes;
        }
        ++changes;
    }
}

bool isSimplified(const PaneNode& root, bool persistentRoot)
{
    return validPane(root, true, persistentRoot);
}

} // namespace Docking
