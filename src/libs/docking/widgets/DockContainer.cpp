// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/widgets/DockContainer.hpp"

#include "docking/DockingConstants.hpp"
#include "docking/DockingManager.hpp"
#include "docking/utils/ResizeGeometry.hpp"
#include "docking/widgets/DockOverlay.hpp"
#include "docking/widgets/DockTitleBar.hpp"

#include <QtCore/QMimeData>
#include <QtGui/QCloseEvent>
#include <QtGui/QCursor>
#include <QtGui/QDragEnterEvent>
#include <QtGui/QDragLeaveEvent>
#include <QtGui/QDragMoveEvent>
#include <QtGui/QDropEvent>
#include <QtGui/QGuiApplication>
#include <QtGui/QMouseEvent>
#include <QtGui/QScreen>
#include <QtWidgets/QRubberBand>
#include <QtWidgets/QVBoxLayout>

namespace Docking {

namespace {

bool carriesPanel(const QMimeData* mime)
{
    return mime && mime->hasFormat(QString::fromLatin1(Constants::kPanelMimeType));
}

} // namespace

DockContainer::DockContainer(DockingManager* manager, WindowKind kind, QWidget* parent)
    : QWidget(parent)
    , m_manager(manager)
    , m_kind(kind)
{
    setObjectName(QStringLiteral("DockContainer"));
    setAcceptDrops(true);
    setMouseTracking(true);

    m_layout = new QVBoxLayout(this);
    m_layout->setSpacing(0);

    if (m_kind == WindowKind::MainDockArea) {
        m_layout->setContentsMargins(0, 0, 0, 0);
    } else {
        setWindowFlags(Qt::Window | Qt::FramelessWindowHint);
        setAttribute(Qt::WA_DeleteOnClose, false);
        setStyleSheet(QStringLiteral("#DockContainer { border: 1px solid %1; }")
                          .arg(QString::fromLatin1(Constants::kContainerBorderColor)));
        const int border = Constants::kContainerBorderPx;
        m_layout->setContentsMargins(border, border, border, border);

        m_titleBar = new DockTitleBar(this);
        if (manager)
            m_titleBar->setFixedHeight(manager->config().titleBarHeight);
        m_layout->addWidget(m_titleBar);

        if (manager)
            setMinimumSize(manager->config().minimumContainerSize);
    }

    m_contentHost = new QWidget(this);
    m_contentHost->setObjectName(QStringLiteral("DockContentHost"));
    m_contentLayout = new QVBoxLayout(m_contentHost);
    m_contentLayout->setContentsMargins(0, 0, 0, 0);
    m_contentLayout->setSpacing(0);
    m_layout->addWidget(m_contentHost, 1);
}

DockContainer::~DockContainer()
{
    if (m_resizePreview)
        delete m_resizePreview.data();
}

QWidget* DockContainer::takeContentWidget()
{
    QWidget* old = m_content.data();
    if (old)
        m_contentLayout->removeWidget(old);
    m_content = nullptr;
    m_routes.clear();
    return old;
}

void DockContainer::setContentWidget(QWidget* content)
{
    if (m_content && m_content != content)
        m_contentLayout->removeWidget(m_content);
    m_content = content;
    if (content) {
        content->setParent(m_contentHost);
        m_contentLayout->addWidget(content);
        content->show();
    }
}

void DockContainer::setRoutes(RenderRoutes routes)
{
    m_routes = std::move(routes);
}

void DockContainer::setExplicitTitle(const QString& title)
{
    m_explicitTitle = title;
    if (!title.isEmpty())
        updateTitle({});
}

void DockContainer::updateTitle(const QStringList& panelTitles)
{
    const QString title = !m_explicitTitle.isEmpty() ? m_explicitTitle : panelTitles.join(QStringLiteral(", "));
    setWindowTitle(title);
    if (m_titleBar)
        m_titleBar->setTitle(title);
}

void DockContainer::setMaximizedState(bool maximized, const QRect& normalGeometry)
{
    if (m_kind == WindowKind::MainDockArea)
        return;

    if (maximized) {
        m_normalGeometry = normalGeometry.isValid() ? normalGeometry : geometry();
        QScreen* screen = this->screen() ? this->screen() : QGuiApplication::primaryScreen();
        if (screen)
            setGeometry(screen->availableGeometry());
    } else if (m_maximized && m_normalGeometry.isValid()) {
        setGeometry(m_normalGeometry);
    }
    m_maximized = maximized;
    if (m_titleBar)
        m_titleBar->setMaximized(maximized);
}

void DockContainer::toggleMaximize()
{
    setMaximizedState(!m_maximized);
}

Qt::Edges DockContainer::resizeEdgesAt(const QPoint& localPos) const
{
    if (m_kind == WindowKind::MainDockArea || m_maximized)
        return {};
    const int margin = m_manager ? m_manager->config().resizeMargin : 8;
    return Support::resizeEdgesAt(rect(), localPos, margin);
}

void DockContainer::closeFromManager()
{
    m_managedClose = true;
    DockOverlay::destroyFor(this);
    if (m_resizePreview)
        m_resizePreview->hide();
    close();
    deleteLater();
}

void DockContainer::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }

    const Qt::Edges edges = resizeEdgesAt(event->position().toPoint());
    if (!edges || !m_manager || !m_manager->beginResize(this)) {
        QWidget::mousePressEvent(event);
        return;
    }

    m_resizeEdges = edges;
    m_resizePressGlobal = event->globalPosition().toPoint();
    m_resizeStartGeometry = geometry();

    m_resizePreview = new QRubberBand(QRubberBand::Rectangle);
    m_resizePreview->setGeometry(m_resizeStartGeometry);
    m_resizePreview->show();
    grabMouse();
    event->accept();
}

void DockContainer::mouseMoveEvent(QMouseEvent* event)
{
    if (!isResizing()) {
        setCursor(Support::cursorForEdges(resizeEdgesAt(event->position().toPoint())));
        QWidget::mouseMoveEvent(event);
        return;
    }

    const QPoint delta = event->globalPosition().toPoint() - m_resizePressGlobal;
    const QRect next = Support::resizedGeometry(m_resizeStartGeometry, m_resizeEdges, delta, minimumSize());
    if (m_resizePreview)
        m_resizePreview->setGeometry(next);
    event->accept();
}

void DockContainer::mouseReleaseEvent(QMouseEvent* event)
{
    if (!isResizing() || event->button() != Qt::LeftButton) {
        QWidget::mouseReleaseEvent(event);
        return;
    }

    const QPoint delta = event->globalPosition().toPoint() - m_resizePressGlobal;
    setGeometry(Support::resizedGeometry(m_resizeStartGeometry, m_resizeEdges, delta, minimumSize()));
    finishResize();
    event->accept();
}

void DockContainer::finishResize()
{
    m_resizeEdges = {};
    releaseMouse();
    if (m_resizePreview) {
        m_resizePreview->hide();
        m_resizePreview->deleteLater();
        m_resizePreview = nullptr;
    }
    if (m_manager)
        m_manager->endResize(this);
}

void DockContainer::leaveEvent(QEvent* event)
{
    if (!isResizing())
        unsetCursor();
    QWidget::leaveEvent(event);
}

void DockContainer::closeEvent(QCloseEvent* event)
{
    if (m_managedClose || !m_manager || m_kind == WindowKind::MainDockArea) {
        QWidget::closeEvent(event);
        return;
    }

    // Closed by the window system: let the manager tear the root down.
    event->ignore();
    QPointer<DockContainer> self(this);
    QPointer<DockingManager> manager(m_manager);
    QMetaObject::invokeMethod(manager.data(), [self, manager] {
        if (!self || !manager)
            return;
        const Utils::Result result = manager->closeContainer(self.data());
        if (!result)
            qCWarning(dockinglog).noquote() << "Close window failed:" << result.joined(QStringLiteral("; "));
    }, Qt::QueuedConnection);
}

void DockContainer::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    if (DockOverlay* overlay = DockOverlay::overlayFor(this))
        overlay->syncToOwner();
}

void DockContainer::dragEnterEvent(QDragEnterEvent* event)
{
    if (!carriesPanel(event->mimeData()) || !m_manager) {
        event->ignore();
        return;
    }
    event->acceptProposedAction();
    m_manager->updateNativeDrag(mapToGlobal(event->position().toPoint()));
}

void DockContainer::dragMoveEvent(QDragMoveEvent* event)
{
    if (!carriesPanel(event->mimeData()) || !m_manager) {
        event->ignore();
        return;
    }
    event->acceptProposedAction();
    m_manager->updateNativeDrag(mapToGlobal(event->position().toPoint()));
}

void DockContainer::dragLeaveEvent(QDragLeaveEvent* event)
{
    if (m_manager)
        m_manager->updateNativeDrag(QCursor::pos());
    QWidget::dragLeaveEvent(event);
}

void DockContainer::dropEvent(QDropEvent* event)
{
    if (!carriesPanel(event->mimeData()) || !m_manager) {
        event->ignore();
        return;
    }
    if (m_manager->finishNativeDrop(mapToGlobal(event->position().toPoint())))
        event->acceptProposedAction();
    else
        event->ignore();
}

} // namespace Docking
