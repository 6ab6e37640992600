// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/widgets/DockTitleBar.hpp"

#include "docking/DockingConstants.hpp"
#include "docking/DockingManager.hpp"
#include "docking/widgets/DockContainer.hpp"

#include <QtGui/QMouseEvent>
#include <QtWidgets/QApplication>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QToolButton>

namespace Docking {

DockTitleBar::DockTitleBar(DockContainer* container)
    : QWidget(container)
    , m_container(container)
{
    setObjectName(QStringLiteral("DockTitleBar"));
    setAttribute(Qt::WA_StyledBackground, true);
    setStyleSheet(QStringLiteral("#DockTitleBar { background: %1; }")
                      .arg(QString::fromLatin1(Constants::kTitleBarColor)));

    auto* layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 0, 2, 0);
    layout->setSpacing(2);

    m_label = new QLabel(this);
    m_label->setObjectName(QStringLiteral("DockTitleLabel"));
    m_label->setAttribute(Qt::WA_TransparentForMouseEvents, true);
    layout->addWidget(m_label, 1);

    m_maximizeButton = new QToolButton(this);
    m_maximizeButton->setObjectName(QStringLiteral("DockMaximizeButton"));
    m_maximizeButton->setAutoRaise(true);
    m_maximizeButton->setText(QStringLiteral("□"));
    layout->addWidget(m_maximizeButton);

    m_closeButton = new QToolButton(this);
    m_closeButton->setObjectName(QStringLiteral("DockCloseButton"));
    m_closeButton->setAutoRaise(true);
    m_closeButton->setText(QStringLiteral("✕"));
    layout->addWidget(m_closeButton);

    connect(m_maximizeButton, &QToolButton::clicked, this, [this] {
        if (m_container)
            m_container->toggleMaximize();
    });
    connect(m_closeButton, &QToolButton::clicked, this, [this] {
        if (!m_container || !m_container->manager())
            return;
        const Utils::Result result = m_container->manager()->closeContainer(m_container);
        if (!result)
            qCWarning(dockinglog).noquote() << "Close window failed:" << result.joined(QStringLiteral("; "));
    });
}

QString DockTitleBar::title() const
{
    return m_label->text();
}

void DockTitleBar::setTitle(const QString& title)
{
    m_label->setText(title);
}

void DockTitleBar::setMaximized(bool maximized)
{
    m_maximizeButton->setText(maximized ? QStringLiteral("❐") : QStringLiteral("□"));
}

void DockTitleBar::beginSeededMove()
{
    m_pressed = true;
    m_moving = true;
    m_grabbed = true;
    grabMouse();
}

void DockTitleBar::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_container) {
        QWidget::mousePressEvent(event);
        return;
    }

    // Let the container take presses on its resize border.
    if (m_container->resizeEdgesAt(mapTo(m_container, event->position().toPoint()))) {
        event->ignore();
        return;
    }

    m_pressed = true;
    m_pressGlobal = event->globalPosition().toPoint();
    event->accept();
}

void DockTitleBar::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_pressed || !m_container || !m_container->manager()) {
        QWidget::mouseMoveEvent(event);
        return;
    }

    DockingManager* manager = m_container->manager();
    const QPoint globalPos = event->globalPosition().toPoint();
    if (!m_moving) {
        if ((globalPos - m_pressGlobal).manhattanLength() < QApplication::startDragDistance())
            return;
        m_moving = manager->beginWindowDrag(m_container, m_pressGlobal);
        if (!m_moving) {
            m_pressed = false;
            return;
        }
    }

    manager->updateWindowDrag(globalPos);
    event->accept();
}

void DockTitleBar::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_pressed) {
        QWidget::mouseReleaseEvent(event);
        return;
    }
    stopMoving(event->globalPosition().toPoint());
    event->accept();
}

void DockTitleBar::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_container) {
        m_container->toggleMaximize();
        event->accept();
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}

void DockTitleBar::stopMoving(const QPoint& globalPos)
{
    const bool wasMoving = m_moving;
    m_pressed = false;
    m_moving = false;
    if (m_grabbed) {
        m_grabbed = false;
        releaseMouse();
    }
    if (wasMoving && m_container && m_container->manager())
        m_container->manager()->endWindowDrag(globalPos);
}

} // namespace Docking
