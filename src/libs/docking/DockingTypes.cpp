// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockingTypes.hpp"

namespace Docking {

using namespace Qt::StringLiterals;

QString dockingStateToString(DockingState state)
{
    switch (state) {
        case DockingState::Idle: return u"idle"_s;
        case DockingState::DraggingWindow: return u"dragging-window"_s;
        case DockingState::DraggingTab: return u"dragging-tab"_s;
        case DockingState::Resizing: return u"resizing"_s;
        case DockingState::Rendering: return u"rendering"_s;
    }
    return u"idle"_s;
}

QString windowKindToString(WindowKind kind)
{
    switch (kind) {
        case WindowKind::Floating: return u"floating"_s;
        case WindowKind::FloatingRoot: return u"floatingRoot"_s;
        case WindowKind::MainDockArea: return u"mainDockArea"_s;
    }
    return u"floating"_s;
}

std::optional<WindowKind> windowKindFromString(const QString& text)
{
    const QString key = text.trimmed();
    if (key == u"floating"_s)
        return WindowKind::Floating;
    if (key == u"floatingRoot"_s)
        return WindowKind::FloatingRoot;
    if (key == u"mainDockArea"_s)
        return WindowKind::MainDockArea;
    return std::nullopt;
}

} // namespace Docking
