// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/widgets/DockTabBar.hpp"

#include "docking/DockingConstants.hpp"

#include <QtGui/QColor>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <QtGui/QPen>
#include <QtWidgets/QApplication>

namespace Docking {

DockTabBar::DockTabBar(QWidget* parent)
    : QTabBar(parent)
{
    setObjectName(QStringLiteral("DockTabBar"));
    setMovable(true);
    setElideMode(Qt::ElideRight);
}

QVector<QRect> DockTabBar::tabRects() const
{
    QVector<QRect> rects;
    rects.reserve(count());
    for (int i = 0; i < count(); ++i)
        rects.push_back(tabRect(i));
    return rects;
}

void DockTabBar::setDropIndicatorIndex(int index)
{
    if (m_dropIndicatorIndex == index)
        return;
    m_dropIndicatorIndex = index;
    update();
}

bool DockTabBar::isTearGesture(const QPoint& pressPos,
                               const QPoint& pos,
                               const QRect& barRect,
                               int startDragDistance,
                               int threshold)
{
    if ((pos - pressPos).manhattanLength() <= startDragDistance * 2)
        return false;
    return pos.y() < barRect.top() - threshold || pos.y() > barRect.bottom() + threshold;
}

void DockTabBar::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_pressIndex = tabAt(event->position().toPoint());
        m_pressPos = event->position().toPoint();
    }
    QTabBar::mousePressEvent(event);
}

void DockTabBar::mouseMoveEvent(QMouseEvent* event)
{
    if (m_pressIndex < 0 || !(event->buttons() & Qt::LeftButton)) {
        QTabBar::mouseMoveEvent(event);
        return;
    }

    const QPoint pos = event->position().toPoint();
    if (!isTearGesture(m_pressPos, pos, rect(), QApplication::startDragDistance(), m_tearThreshold)) {
        QTabBar::mouseMoveEvent(event);
        return;
    }

    const int index = m_pressIndex;
    m_pressIndex = -1;
    event->accept();
    if (m_dragMode == TabDragMode::NativeDrag)
        emit nativeDragRequested(index);
    else
        emit tearRequested(index, event->globalPosition().toPoint());
}

void DockTabBar::mouseReleaseEvent(QMouseEvent* event)
{
    m_pressIndex = -1;
    QTabBar::mouseReleaseEvent(event);
}

void DockTabBar::paintEvent(QPaintEvent* event)
{
    QTabBar::paintEvent(event);
    if (m_dropIndicatorIndex < 0)
        return;

    int x = 0;
    if (count() > 0) {
        x = m_dropIndicatorIndex < count() ? tabRect(m_dropIndicatorIndex).left()
                                           : tabRect(count() - 1).right();
    }

    QPainter painter(this);
    QPen pen(QColor(QString::fromLatin1(Constants::kDropIndicatorColor)));
    pen.setWidth(Constants::kDropIndicatorWidth);
    painter.setPen(pen);
    painter.drawLine(x, 0, x, height());
}

} // namespace Docking
