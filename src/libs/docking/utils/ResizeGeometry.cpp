// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/utils/ResizeGeometry.hpp"

namespace Docking::Support {

Qt::Edges resizeEdgesAt(const QRect& rect, const QPoint& pos, int margin)
{
    Qt::Edges edges;
    if (!rect.contains(pos) || margin <= 0)
        return edges;

    if (pos.x() < rect.left() + margin)
        edges |= Qt::LeftEdge;
    else if (pos.x() > rect.right() - margin)
        edges |= Qt::RightEdge;

    if (pos.y() < rect.top() + margin)
        edges |= Qt::TopEdge;
    else if (pos.y() > rect.bottom() - margin)
        edges |= Qt::BottomEdge;

    return edges;
}

QRect resizedGeometry(const QRect& start, Qt::Edges edges, const QPoint& delta, const QSize& minSize)
{
    QRect r = start;
    const int minW = qMax(1, minSize.width());
    const int minH = qMax(1, minSize.height());

    if (edges & Qt::LeftEdge)
        r.setLeft(qMin(start.left() + delta.x(), start.right() - minW + 1));
    else if (edges & Qt::RightEdge)
        r.setRight(qMax(start.right() + delta.x(), start.left() + minW - 1));

    if (edges & Qt::TopEdge)
        r.setTop(qMin(start.top() + delta.y(), start.bottom() - minH + 1));
    else if (edges & Qt::BottomEdge)
        r.setBottom(qMax(start.bottom() + delta.y(), start.top() + minH - 1));

    return r;
}

Qt::CursorShape cursorForEdges(Qt::Edges edges)
{
    const bool left = edges & Qt::LeftEdge;
    const bool right = edges & Qt::RightEdge;
    const bool top = edges & Qt::TopEdge;
    const bool bottom = edges & Qt::BottomEdge;

    if ((top && left) || (bottom && right))
        return Qt::SizeFDiagCursor;
    if ((top && right) || (bottom && left))
        return Qt::SizeBDiagCursor;
    if (left || right)
        return Qt::SizeHorCursor;
    if (top || bottom)
        return Qt::SizeVerCursor;
    return Qt::ArrowCursor;
}

} // namespace Docking::Support
