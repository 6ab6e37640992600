// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/model/LayoutNode.hpp"

namespace Docking {

enum class SimplifyStep : unsigned char {
    None,
    DroppedEmptyPane,
    PromotedSoleChild,
    RootEmpty
};

// Performs at most one structural change on the tree. Callers loop until None,
// re-rendering between steps. An empty tab-group root of a persistent window is
// a valid placeholder and reports None.
DOCKING_EXPORT SimplifyStep simplifyOnce(PaneNode& root, bool persistentRoot);

// Runs simplifyOnce to a fixed point. Returns the number of changes; stops at
// RootEmpty and reports it through rootEmptyOut.
DOCKING_EXPORT int simplify(PaneNode& root, bool persistentRoot, bool* rootEmptyOut = nullptr);

// True when no splitter has fewer than two children and no tab group is empty,
// apart from a persistent placeholder root.
DOCKING_EXPORT bool isSimplified(const PaneNode& root, bool persistentRoot);

} // namespace Docking
