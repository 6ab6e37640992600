// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QSize>
#include <QtCore/QHashFunctions>
#include <QtCore/QString>

#include <optional>

namespace Docking {

enum class DockLocation : unsigned char {
    Top,
    Left,
    Bottom,
    Right,
    Center
};

enum class DockingState : unsigned char {
    Idle,
    DraggingWindow,
    DraggingTab,
    Resizing,
    Rendering
};

enum class WindowKind : unsigned char {
    Floating,
    FloatingRoot,
    MainDockArea
};

enum class TabDragMode : unsigned char {
    TearOff,
    NativeDrag
};

DOCKING_EXPORT QString dockingStateToString(DockingState state);

DOCKING_EXPORT QString windowKindToString(WindowKind kind);
DOCKING_EXPORT std::optional<WindowKind> windowKindFromString(const QString& text);

inline size_t qHash(DockLocation location, size_t seed = 0) noexcept
{
    return ::qHash(static_cast<unsigned int>(location), seed);
}

// Directional docks create splitters; center merges tabs.
inline bool isDirectional(DockLocation location) { return location != DockLocation::Center; }

struct DockingConfig final {
    int overlayIconSize = 40;
    int overlayClusterSpacing = 5;
    int overlaySpreadInset = 10;

    int resizeMargin = 8;
    QSize minimumContainerSize{200, 150};

    int titleBarHeight = 30;
    int contentMargin = 5;

    QSize defaultFloatingSize{350, 250};
    QSize tearOffFallbackSize{300, 200};
    int tearOffOffsetX = 50;
    int tearThresholdPx = 30;

    int cascadeOriginPx = 150;
    int cascadeStepPx = 40;
    int cascadeSlots = 7;

    TabDragMode tabDragMode = TabDragMode::TearOff;
};

} // namespace Docking
