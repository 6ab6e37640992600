// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"

#include <QtCore/QPoint>
#include <QtCore/QRect>
#include <QtCore/QVector>
#include <QtWidgets/QTabBar>

namespace Docking {

class DOCKING_EXPORT DockTabBar final : public QTabBar
{
    Q_OBJECT

public:
    explicit DockTabBar(QWidget* parent = nullptr);

    QVector<QRect> tabRects() const;

    void setDropIndicatorIndex(int index);
    int dropIndicatorIndex() const { return m_dropIndicatorIndex; }

    void setTearThreshold(int px) { m_tearThreshold = px; }
    void setDragMode(TabDragMode mode) { m_dragMode = mode; }

    static bool isTearGesture(const QPoint& pressPos,
                              const QPoint& pos,
                              const QRect& barRect,
                              int startDragDistance,
                              int threshold);

signals:
    void tearRequested(int index, const QPoint& globalPos);
    void nativeDragRequested(int index);

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void paintEvent(QPaintEvent* event) override;

private:
    int m_pressIndex = -1;
    QPoint m_pressPos;
    int m_dropIndicatorIndex = -1;
    int m_tearThreshold = 30;
    TabDragMode m_dragMode = TabDragMode::TearOff;
};

} // namespace Docking
