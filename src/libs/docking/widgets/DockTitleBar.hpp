// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QPoint>
#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

QT_BEGIN_NAMESPACE
class QLabel;
class QToolButton;
QT_END_NAMESPACE

namespace Docking {

class DockContainer;

class DOCKING_EXPORT DockTitleBar final : public QWidget
{
    Q_OBJECT

public:
    explicit DockTitleBar(DockContainer* container);

    QString title() const;
    void setTitle(const QString& title);
    void setMaximized(bool maximized);

    // Continues a drag that started elsewhere (a torn-off tab) without a new
    // mouse press.
    void beginSeededMove();
    bool isMoving() const { return m_moving; }

    QToolButton* closeButton() const { return m_closeButton; }
    QToolButton* maximizeButton() const { return m_maximizeButton; }

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    void stopMoving(const QPoint& globalPos);

    QPointer<DockContainer> m_container;
    QLabel* m_label = nullptr;
    QToolButton* m_maximizeButton = nullptr;
    QToolButton* m_closeButton = nullptr;

    bool m_pressed = false;
    bool m_moving = false;
    bool m_grabbed = false;
    QPoint m_pressGlobal;
};

} // namespace Docking
