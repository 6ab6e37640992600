// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"
#include "docking/model/LayoutNode.hpp"
#include "docking/services/RenderRoutes.hpp"

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Docking {

class DockContainer;
class DockPanel;

// Tab bar and corner controls of a tab group. Hidden only for the single tab
// that is the whole content of a non-persistent window.
DOCKING_EXPORT bool tabChromeVisible(bool insideSplitter, int tabCount, bool persistentRoot);

class DOCKING_EXPORT LayoutRenderer final
{
public:
    void setConfig(const DockingConfig& config) { m_config = config; }
    const DockingConfig& config() const { return m_config; }

    // Rebuilds the container's widgets from root. The previous subtree is
    // discarded; panels left in it are detached and hidden.
    void render(DockContainer* container, const PaneNode& root, DockPanel* activate = nullptr) const;

    // Copies live splitter sizes back into the splitter nodes.
    static void captureSplitterSizes(const DockContainer* container);

private:
    QWidget* buildPane(const PaneNode& node,
                       bool insideSplitter,
                       bool persistentRoot,
                       DockPanel* activate,
                       RenderRoutes& routes) const;

    DockingConfig m_config;
};

} // namespace Docking
