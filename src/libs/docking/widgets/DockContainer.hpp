// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"
#include "docking/services/RenderRoutes.hpp"

#include <QtCore/QPointer>
#include <QtCore/QRect>
#include <QtCore/QStringList>
#include <QtWidgets/QWidget>

QT_BEGIN_NAMESPACE
class QRubberBand;
class QVBoxLayout;
QT_END_NAMESPACE

namespace Docking {

class DockingManager;
class DockTitleBar;

// A window that hosts one layout root. Floating kinds are frameless top-level
// windows with their own title bar and resize border; the main dock area is
// embedded in a host window.
class DOCKING_EXPORT DockContainer final : public QWidget
{
    Q_OBJECT

public:
    DockContainer(DockingManager* manager, WindowKind kind, QWidget* parent = nullptr);
    ~DockContainer() override;

    DockingManager* manager() const { return m_manager.data(); }
    WindowKind kind() const { return m_kind; }
    bool isPersistentRoot() const { return m_kind != WindowKind::Floating; }
    bool isMainDockArea() const { return m_kind == WindowKind::MainDockArea; }

    DockTitleBar* titleBar() const { return m_titleBar; }

    QWidget* contentWidget() const { return m_content.data(); }
    QWidget* takeContentWidget();
    void setContentWidget(QWidget* content);

    const RenderRoutes& routes() const { return m_routes; }
    void setRoutes(RenderRoutes routes);

    QString explicitTitle() const { return m_explicitTitle; }
    void setExplicitTitle(const QString& title);
    void updateTitle(const QStringList& panelTitles);

    bool isMaximizedState() const { return m_maximized; }
    QRect storedNormalGeometry() const { return m_normalGeometry; }
    void setMaximizedState(bool maximized, const QRect& normalGeometry = {});
    void toggleMaximize();

    Qt::Edges resizeEdgesAt(const QPoint& localPos) const;
    bool isResizing() const { return m_resizeEdges != Qt::Edges(); }

    // Closes without routing back through the manager.
    void closeFromManager();

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;
    void closeEvent(QCloseEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dragMoveEvent(QDragMoveEvent* event) override;
    void dragLeaveEvent(QDragLeaveEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private:
    void finishResize();

    QPointer<DockingManager> m_manager;
    WindowKind m_kind = WindowKind::Floating;

    QVBoxLayout* m_layout = nullptr;
    DockTitleBar* m_titleBar = nullptr;
    QWidget* m_contentHost = nullptr;
    QVBoxLayout* m_contentLayout = nullptr;
    QPointer<QWidget> m_content;
    RenderRoutes m_routes;

    QString m_explicitTitle;

    bool m_maximized = false;
    QRect m_normalGeometry;

    Qt::Edges m_resizeEdges;
    QPoint m_resizePressGlobal;
    QRect m_resizeStartGeometry;
    QPointer<QRubberBand> m_resizePreview;

    bool m_managedClose = false;
};

} // namespace Docking
