// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QPoint>
#include <QtCore/QRect>
#include <QtCore/QSize>

namespace Docking::Support {

// Edges within margin of the (local) window rect under pos.
DOCKING_EXPORT Qt::Edges resizeEdgesAt(const QRect& rect, const QPoint& pos, int margin);

// Start geometry moved by delta along the grabbed edges, clamped to minSize.
// The opposite edge stays fixed.
DOCKING_EXPORT QRect resizedGeometry(const QRect& start, Qt::Edges edges, const QPoint& delta, const QSize& minSize);

DOCKING_EXPORT Qt::CursorShape cursorForEdges(Qt::Edges edges);

} // namespace Docking::Support
