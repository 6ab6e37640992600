// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockingManager.hpp"

#include "docking/DockingConstants.hpp"
#include "docking/model/LayoutSimplifier.hpp"
#include "docking/persistence/LayoutSerializer.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockOverlay.hpp"
#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/DockTabWidget.hpp"
#include "docking/widgets/DockTitleBar.hpp"

#include <utils/Macros.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QCoreApplication>
#include <QtCore/QMimeData>
#include <QtCore/QTimer>
#include <QtCore/QUuid>
#include <QtGui/QCursor>
#include <QtGui/QDrag>
#include <QtGui/QPixmap>

#include <utility>

namespace Docking {

namespace {

using namespace Qt::StringLiterals;

constexpr int kDeferredReconcileMs = 50;

QString describePanel(const DockPanel* panel)
{
    return panel ? u"Widget '%1'"_s.arg(panel->persistentId()) : u"Widget <null>"_s;
}

Utils::Result untracked(const QString& what)
{
    return Utils::Result::failure(u"%1 is not tracked by the docking manager."_s.arg(what));
}

Qt::Orientation orientationFor(DockLocation location)
{
    return (location == DockLocation::Top || location == DockLocation::Bottom) ? Qt::Vertical : Qt::Horizontal;
}

bool sourceGoesFirst(DockLocation location)
{
    return location == DockLocation::Top || location == DockLocation::Left;
}

} // namespace

DockingManager::DockingManager(QObject* parent)
    : QObject(parent)
    , m_drag(&m_model)
{
    setConfig(m_config);
}

DockingManager::~DockingManager()
{
    m_shuttingDown = true;
    m_drag.cancel();

    const QList<DockContainer*> windows = m_model.windows();
    m_model.clear();
    for (DockContainer* window : windows) {
        if (!window->isMainDockArea())
            delete window;
    }
}

void DockingManager::setConfig(const DockingConfig& config)
{
    m_config = config;
    m_renderer.setConfig(config);

    OverlayMetrics metrics;
    metrics.iconSize = config.overlayIconSize;
    metrics.clusterSpacing = config.overlayClusterSpacing;
    metrics.spreadInset = config.overlaySpreadInset;
    m_drag.setMetrics(metrics);
}

// Registration ---------------------------------------------------------------

DockContainer* DockingManager::createContainer(WindowKind kind, QWidget* parent)
{
    auto* container = new DockContainer(this, kind, parent);
    trackContainer(container);
    return container;
}

void DockingManager::trackContainer(DockContainer* container)
{
    connect(container, &QObject::destroyed, this, [this](QObject* object) {
        m_windowStack.removeIf([object](const QPointer<DockContainer>& w) {
            return w.isNull() || w.data() == object;
        });
        m_dirtyWindows.removeIf([object](const QPointer<DockContainer>& w) {
            return w.isNull() || w.data() == object;
        });
        if (m_dragWindow.data() == object)
            m_dragWindow = nullptr;
        if (m_shuttingDown)
            return;
        const int before = m_model.rootCount();
        const QList<DockContainer*> changed = m_model.pruneDead(object);
        if (before != m_model.rootCount() || !changed.isEmpty())
            emitLayoutChanged();
    });
}

void DockingManager::trackPanel(DockPanel* panel)
{
    if (!panel || m_trackedPanels.contains(panel))
        return;
    m_trackedPanels.insert(panel);

    connect(panel, &QObject::destroyed, this, [this](QObject* object) {
        m_trackedPanels.remove(object);
        if (m_shuttingDown)
            return;

        const QList<DockContainer*> changed = m_model.pruneDead(object);
        for (DockContainer* window : changed) {
            if (!m_dirtyWindows.contains(window))
                m_dirtyWindows.push_back(window);
        }
        if (!changed.isEmpty() && !m_reconcileQueued) {
            m_reconcileQueued = true;
            QMetaObject::invokeMethod(this, &DockingManager::reconcileDirtyWindows, Qt::QueuedConnection);
        }
    });
}

DockPanel* DockingManager::wrapContent(QWidget* content, const QString& persistentId, const QString& title)
{
    if (!content)
        return nullptr;
    if (auto* panel = qobject_cast<DockPanel*>(content))
        return panel;

    const QString id = persistentId.trimmed().isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces)
                                                        : persistentId.trimmed();
    const QString text = title.isEmpty() ? (content->windowTitle().isEmpty() ? id : content->windowTitle()) : title;
    auto* panel = new DockPanel(content, id, text);
    panel->setContentMargin(m_config.contentMargin);
    return panel;
}

DockContainer* DockingManager::createFloatingWindow(QWidget* content,
                                                    const QString& persistentId,
                                                    const QString& title,
                                                    std::optional<QPoint> pos,
                                                    std::optional<QSize> size)
{
    DockPanel* panel = wrapContent(content, persistentId, title);
    if (!panel) {
        qCWarning(dockinglog) << "createFloatingWindow called without content";
        return nullptr;
    }
    return registerWidget(panel, pos, size);
}

DockContainer* DockingManager::registerWidget(DockPanel* panel, std::optional<QPoint> pos, std::optional<QSize> size)
{
    if (!panel)
        return nullptr;

    const HostInfo existing = m_model.findHost(panel);
    if (existing.isValid()) {
        qCWarning(dockinglog).noquote() << describePanel(panel) << "is already registered.";
        return existing.window;
    }

    trackPanel(panel);
    DockContainer* container = createContainer(WindowKind::Floating);
    m_model.registerRoot(container, panel);

    const QSize contentSize = size.value_or(m_config.defaultFloatingSize);
    container->resize(contentSize.width(), contentSize.height() + m_config.titleBarHeight);
    container->move(pos ? *pos : cascadePosition());

    renderContainer(container, panel);
    container->show();
    bringToFront(container);
    emitLayoutChanged();
    return container;
}

Utils::Result DockingManager::unregisterWidget(DockPanel* panel)
{
    const HostInfo host = m_model.findHost(panel);
    if (!host.isValid())
        return untracked(describePanel(panel));

    captureSizes(host.window);
    m_model.removeWidget(panel);
    DockOverlay::destroyFor(panel);
    panel->hide();
    panel->setParent(nullptr);
    reconcile(host.window);
    emitLayoutChanged();
    return Utils::Result::success();
}

DockContainer* DockingManager::createPanelFromKey(const QString& key, std::optional<QPoint> pos, std::optional<QSize> size)
{
    const auto registration = m_registry.registration(key);
    if (!registration) {
        qCWarning(dockinglog).noquote() << "No widget type registered for key" << key;
        return nullptr;
    }

    QString error;
    QWidget* content = m_registry.create(key, &error);
    if (!content) {
        qCWarning(dockinglog).noquote() << error;
        return nullptr;
    }
    return createFloatingWindow(content, registration->key, registration->defaultTitle, pos, size);
}

Utils::Result DockingManager::registerDockArea(DockContainer* container)
{
    if (!container)
        return Utils::Result::failure(u"Dock area is null."_s);
    if (m_model.contains(container))
        return Utils::Result::failure(u"Dock area is already registered."_s);
    if (!container->isPersistentRoot())
        return Utils::Result::failure(u"Only persistent containers can be registered as dock areas."_s);

    if (container->manager() != this)
        return Utils::Result::failure(u"Dock area belongs to another docking manager."_s);

    trackContainer(container);
    m_model.registerEmptyRoot(container);
    m_windowStack.push_back(container);
    renderContainer(container);
    emitLayoutChanged();
    return Utils::Result::success();
}

Utils::Result DockingManager::unregisterDockArea(DockContainer* container)
{
    if (!container || !m_model.contains(container))
        return untracked(u"Dock area"_s);

    const QList<DockPanel*> panels = panelsOf(container);
    for (DockPanel* panel : panels)
        emit widgetClosed(panel->persistentId());

    m_model.unregisterRoot(container);
    discardPanels(panels);
    m_windowStack.removeAll(container);
    if (QWidget* content = container->takeContentWidget()) {
        content->hide();
        content->deleteLater();
    }
    m_drag.cache().invalidate();
    emitLayoutChanged();
    return Utils::Result::success();
}

DockContainer* DockingManager::createFloatingRoot(const QString& title)
{
    DockContainer* container = createContainer(WindowKind::FloatingRoot);
    container->setExplicitTitle(title.isEmpty() ? tr("Dock Area") : title);
    m_model.registerEmptyRoot(container);

    const QSize size = m_config.defaultFloatingSize;
    container->resize(size.width(), size.height() + m_config.titleBarHeight);
    container->move(cascadePosition());

    renderContainer(container);
    container->show();
    bringToFront(container);
    emitLayoutChanged();
    return container;
}

bool DockingManager::registerWidgetFactory(const QString& key,
                                           WidgetRegistry::Factory factory,
                                           const QString& defaultTitle,
                                           QString* errorOut)
{
    return m_registry.registerFactory(key, std::move(factory), defaultTitle, errorOut);
}

void DockingManager::registerInstanceStateHandlers(const QString& persistentId,
                                                   StateProvider provider,
                                                   StateRestorer restorer)
{
    m_stateHandlers.insert(persistentId, StateHandlers{std::move(provider), std::move(restorer)});
}

void DockingManager::unregisterInstanceStateHandlers(const QString& persistentId)
{
    m_stateHandlers.remove(persistentId);
}

// Rendering ------------------------------------------------------------------

void DockingManager::renderContainer(DockContainer* container, DockPanel* activate)
{
    if (!container)
        return;
    const auto root = m_model.root(container);
    if (!root)
        return;

    auto rendering = m_state.enterRendering();
    m_renderer.render(container, *root, activate);
    wireRoutes(container);
    m_drag.cache().invalidate();
    flushRender(container);
}

void DockingManager::flushRender(DockContainer* container)
{
    QCoreApplication::sendPostedEvents(nullptr, QEvent::LayoutRequest);
    if (container->isVisible())
        container->repaint();
}

void DockingManager::wireRoutes(DockContainer* container)
{
    for (const QPointer<DockTabWidget>& tabs : container->routes().tabWidgets) {
        if (!tabs)
            continue;
        DockTabWidget* t = tabs.data();

        connect(t, &DockTabWidget::closePanelRequested, this, [this](DockPanel* panel) {
            if (!m_state.isIdle())
                return;
            report(closeWidget(panel), "Close widget");
        });
        connect(t, &DockTabWidget::tearRequested, this, [this](DockPanel* panel, const QPoint& globalPos) {
            if (!m_state.isIdle())
                return;
            report(undockByTear(panel, globalPos), "Tear off");
        });
        connect(t, &DockTabWidget::nativeDragRequested, this, [this](DockPanel* panel) {
            // QDrag::exec nests an event loop that may delete the emitting tab
            // bar, so it must not run under the tab bar's mouse handler.
            const QPointer<DockPanel> guard(panel);
            QMetaObject::invokeMethod(this, [this, guard] {
                if (guard && m_state.isIdle())
                    startNativeTabDrag(guard.data());
            }, Qt::QueuedConnection);
        });
        connect(t, &DockTabWidget::panelMoved, this, [this, tabs](int from, int to) {
            if (m_state.isRendering() || !tabs)
                return;
            report(reorderTab(tabs.data(), from, to), "Reorder tabs");
        });
        connect(t, &DockTabWidget::undockGroupRequested, this, [this, tabs] {
            if (!m_state.isIdle() || !tabs)
                return;
            report(undockTabGroup(tabs.data()), "Undock tab group");
        });
        connect(t, &DockTabWidget::closeGroupRequested, this, [this, tabs] {
            if (!m_state.isIdle() || !tabs)
                return;
            report(closeTabGroup(tabs.data()), "Close tab group");
        });
    }
}

void DockingManager::captureSizes(DockContainer* container)
{
    LayoutRenderer::captureSplitterSizes(container);
}

DockingManager::ReconcileOutcome DockingManager::reconcile(DockContainer* container, DockPanel* activate)
{
    const auto current = m_model.root(container);
    if (!current)
        return ReconcileOutcome::Removed;

    PaneNode root = *current;
    int changes = 0;
    for (;;) {
        const SimplifyStep step = simplifyOnce(root, container->isPersistentRoot());
        if (step == SimplifyStep::None)
            break;

        if (step == SimplifyStep::RootEmpty) {
            if (container->isPersistentRoot()) {
                m_model.resetRoot(container);
                renderContainer(container);
                return ReconcileOutcome::Reset;
            }
            m_model.unregisterRoot(container);
            closeWindowSilently(container);
            return ReconcileOutcome::Removed;
        }

        // Promotions and removals can cascade; each one gets its own pass.
        ++changes;
        m_model.setRoot(container, root);
        renderContainer(container, activate);
    }

    if (changes == 0)
        renderContainer(container, activate);
    return ReconcileOutcome::Rendered;
}

void DockingManager::reconcileDirtyWindows()
{
    if (!m_state.isIdle()) {
        QTimer::singleShot(kDeferredReconcileMs, this, &DockingManager::reconcileDirtyWindows);
        return;
    }

    m_reconcileQueued = false;
    const QList<QPointer<DockContainer>> dirty = std::exchange(m_dirtyWindows, {});
    for (const QPointer<DockContainer>& window : dirty) {
        if (window && m_model.contains(window))
            reconcile(window);
    }
    emitLayoutChanged();
}

void DockingManager::closeWindowSilently(DockContainer* container)
{
    if (!container)
        return;

    m_windowStack.removeAll(container);
    if (m_dragWindow == container)
        m_dragWindow = nullptr;

    // Panels still tracked elsewhere must not die with this window.
    for (DockPanel* panel : container->findChildren<DockPanel*>()) {
        if (m_model.findHost(panel).isValid()) {
            panel->hide();
            panel->setParent(nullptr);
        }
    }

    container->closeFromManager();
    m_drag.cache().invalidate();
}

// Operations -----------------------------------------------------------------

Utils::Result DockingManager::resolveSource(const DockSource& source, ResolvedSource& out) const
{
    if (source.panel) {
        const HostInfo host = m_model.findHost(source.panel);
        if (!host.isValid())
            return untracked(describePanel(source.panel));

        out.origin = host.window;
        out.node = host.group->children.at(host.index);
        const auto root = m_model.root(host.window);
        const auto rootGroup = root ? asTabGroup(*root) : TabGroupNodePtr();
        out.wholeWindow = !host.window->isPersistentRoot() && rootGroup && rootGroup->children.size() == 1;
        return Utils::Result::success();
    }

    if (!source.window || !m_model.contains(source.window))
        return untracked(u"Source window"_s);
    if (source.window->isPersistentRoot())
        return Utils::Result::failure(u"Persistent dock areas cannot be docked into other windows."_s);

    out.origin = source.window.data();
    out.wholeWindow = true;
    return Utils::Result::success();
}

DockContainer* DockingManager::windowOfTabs(const DockTabWidget* tabs, TabGroupNodePtr* groupOut) const
{
    if (!tabs)
        return nullptr;
    for (DockContainer* window : m_model.windows()) {
        const TabGroupNodePtr group = window->routes().groupFor(tabs);
        if (!group)
            continue;
        // Routes can outlive a model change until the next render.
        if (m_model.windowOfGroup(group) != window)
            return nullptr;
        if (groupOut)
            *groupOut = group;
        return window;
    }
    return nullptr;
}

Utils::Result DockingManager::dockWidget(DockPanel* source, QWidget* target, DockLocation location)
{
    if (!source)
        return untracked(describePanel(source));
    DockSource src;
    src.panel = source;
    return commitDock(src, target, location);
}

Utils::Result DockingManager::dockContainer(DockContainer* source, QWidget* target, DockLocation location)
{
    DockSource src;
    src.window = source;
    return commitDock(src, target, location);
}

Utils::Result DockingManager::insertWidgetIntoTabGroup(DockPanel* source, DockTabWidget* tabs, int index)
{
    if (!source)
        return untracked(describePanel(source));
    DockSource src;
    src.panel = source;
    return commitTabInsert(src, tabs, index);
}

Utils::Result DockingManager::insertContainerIntoTabGroup(DockContainer* source, DockTabWidget* tabs, int index)
{
    DockSource src;
    src.window = source;
    return commitTabInsert(src, tabs, index);
}

Utils::Result DockingManager::commitDock(const DockSource& source, QWidget* target, DockLocation location)
{
    ResolvedSource resolved;
    if (auto result = resolveSource(source, resolved); !result)
        return result;

    if (!target)
        return Utils::Result::failure(u"Dock target is null."_s);

    auto* targetPanel = qobject_cast<DockPanel*>(target);
    auto* targetWindow = qobject_cast<DockContainer*>(target);
    if (!targetPanel && !targetWindow)
        return Utils::Result::failure(u"Dock target must be a panel or a dock container."_s);

    DockContainer* destination = nullptr;
    if (targetPanel) {
        if (targetPanel == source.panel.data())
            return Utils::Result::failure(u"A widget cannot be docked onto itself."_s);
        const HostInfo targetHost = m_model.findHost(targetPanel);
        if (!targetHost.isValid())
            return untracked(describePanel(targetPanel));
        destination = targetHost.window;
    } else {
        if (!m_model.contains(targetWindow))
            return untracked(u"Target window"_s);
        destination = targetWindow;
    }

    if (resolved.wholeWindow && destination == resolved.origin)
        return Utils::Result::failure(u"A window cannot be docked into itself."_s);

    PaneNode destRoot = *m_model.root(destination);
    if (!targetPanel && location == DockLocation::Center && !isEmptyPane(destRoot) && !firstTabGroup(destRoot))
        return Utils::Result::failure(u"Target window has no tab group to merge into."_s);

    captureSizes(resolved.origin);
    if (destination != resolved.origin)
        captureSizes(destination);

    PaneNode subtree;
    if (resolved.wholeWindow) {
        subtree = *m_model.root(resolved.origin);
    } else {
        m_model.removeWidget(source.panel);
        subtree = makeTabGroup({resolved.node});
    }
    const QList<DockPanel*> moved = allPanels(subtree);

    if (!targetPanel && isEmptyPane(destRoot)) {
        destRoot = subtree;
    } else if (location == DockLocation::Center) {
        const TabGroupNodePtr group = targetPanel ? m_model.findHost(targetPanel).group : firstTabGroup(destRoot);
        group->children += allWidgets(subtree);
    } else {
        // Directional docks keep the target's tab group intact.
        const PaneNode anchor = targetPanel ? PaneNode(m_model.findHost(targetPanel).group) : destRoot;
        const QVector<PaneNode> children = sourceGoesFirst(location) ? QVector<PaneNode>{subtree, anchor}
                                                                     : QVector<PaneNode>{anchor, subtree};
        const SplitterNodePtr splitter = makeSplitter(orientationFor(location), children);
        const Utils::Result replaced = replaceInParent(destRoot, anchor, splitter);
        if (!replaced) {
            qCCritical(dockinglog).noquote() << "Dock consistency error:" << replaced.joined(u"; "_s);
            return replaced;
        }
    }

    m_model.setRoot(destination, destRoot);
    finishMove(resolved, destination, moved);
    return Utils::Result::success();
}

Utils::Result DockingManager::commitTabInsert(const DockSource& source, DockTabWidget* tabs, int index)
{
    TabGroupNodePtr group;
    DockContainer* destination = windowOfTabs(tabs, &group);
    if (!destination)
        return untracked(u"Tab group"_s);

    ResolvedSource resolved;
    if (auto result = resolveSource(source, resolved); !result)
        return result;
    if (resolved.wholeWindow && destination == resolved.origin)
        return Utils::Result::failure(u"A window cannot be docked into itself."_s);

    captureSizes(resolved.origin);
    if (destination != resolved.origin)
        captureSizes(destination);

    int at = qBound(0, index, int(group->children.size()));
    QVector<WidgetNodePtr> widgets;
    if (resolved.wholeWindow) {
        widgets = allWidgets(*m_model.root(resolved.origin));
    } else {
        const HostInfo host = m_model.findHost(source.panel);
        if (host.group == group && host.index < at)
            --at;
        m_model.removeWidget(source.panel);
        widgets = {resolved.node};
    }

    QList<DockPanel*> moved;
    for (int i = 0; i < widgets.size(); ++i) {
        group->children.insert(at + i, widgets.at(i));
        if (widgets.at(i)->panel)
            moved.push_back(widgets.at(i)->panel.data());
    }

    finishMove(resolved, destination, moved);
    return Utils::Result::success();
}

void DockingManager::finishMove(const ResolvedSource& source, DockContainer* destination, const QList<DockPanel*>& moved)
{
    if (source.wholeWindow)
        m_model.unregisterRoot(source.origin);

    DockPanel* activate = moved.isEmpty() ? nullptr : moved.constFirst();
    renderContainer(destination, activate);

    if (source.wholeWindow)
        closeWindowSilently(source.origin);
    else
        reconcile(source.origin, source.origin == destination ? activate : nullptr);

    m_drag.cache().invalidate();
    for (DockPanel* panel : moved)
        emit widgetDocked(panel, destination);
    emitLayoutChanged();
}

Utils::Result DockingManager::commitPendingDrop(const DockSource& source, const PendingDrop& drop)
{
    if (!drop.isValid())
        return Utils::Result::failure(u"No drop target."_s);
    if (drop.kind == PendingDrop::Kind::TabInsert)
        return commitTabInsert(source, drop.tabs.data(), drop.index);
    return commitDock(source, drop.target.data(), drop.location);
}

DockContainer* DockingManager::detachAsFloating(const HostInfo& host, const QRect& geometry)
{
    const WidgetNodePtr node = host.group->children.at(host.index);
    captureSizes(host.window);
    host.group->children.removeAt(host.index);

    DockContainer* container = createContainer(WindowKind::Floating);
    m_model.setRoot(container, makeTabGroup({node}));
    container->setGeometry(geometry);
    renderContainer(container, node->panel.data());
    container->show();
    bringToFront(container);

    reconcile(host.window);
    return container;
}

Utils::Result DockingManager::undockWidget(DockPanel* panel)
{
    const HostInfo host = m_model.findHost(panel);
    if (!host.isValid())
        return untracked(describePanel(panel));

    const auto root = m_model.root(host.window);
    const auto rootGroup = asTabGroup(*root);
    if (!host.window->isPersistentRoot() && rootGroup && rootGroup->children.size() == 1)
        return Utils::Result::success();

    QSize size = floatingSizeFor(panel, m_config.defaultFloatingSize);
    size.rheight() += m_config.titleBarHeight;
    const QPoint pos = panel->isVisible() ? panel->mapToGlobal(QPoint(0, 0)) : cascadePosition();

    detachAsFloating(host, QRect(pos, size));
    emit widgetUndocked(panel);
    emitLayoutChanged();
    return Utils::Result::success();
}

Utils::Result DockingManager::undockByTear(DockPanel* panel, const QPoint& globalPos)
{
    const HostInfo host = m_model.findHost(panel);
    if (!host.isValid())
        return untracked(describePanel(panel));

    const auto root = m_model.root(host.window);
    const auto rootGroup = asTabGroup(*root);
    if (!host.window->isPersistentRoot() && rootGroup && rootGroup->children.size() == 1)
        return Utils::Result::success();

    QSize size = floatingSizeFor(panel, m_config.tearOffFallbackSize);
    size.rheight() += m_config.titleBarHeight;
    // Put the cursor on the new title bar.
    const QPoint pos = globalPos - QPoint(m_config.tearOffOffsetX, m_config.titleBarHeight / 2);

    DockContainer* created = detachAsFloating(host, QRect(pos, size));
    if (created->titleBar() && beginWindowDrag(created, globalPos))
        created->titleBar()->beginSeededMove();

    emit widgetUndocked(panel);
    emitLayoutChanged();
    return Utils::Result::success();
}

Utils::Result DockingManager::undockTabGroup(DockTabWidget* tabs)
{
    TabGroupNodePtr group;
    DockContainer* window = windowOfTabs(tabs, &group);
    if (!window)
        return untracked(u"Tab group"_s);

    const PaneNode root = *m_model.root(window);
    if (!window->isPersistentRoot() && samePane(root, group))
        return Utils::Result::success();
    if (group->children.isEmpty())
        return Utils::Result::failure(u"Cannot float an empty tab group."_s);

    QRect geometry;
    if (tabs->isVisible()) {
        geometry = QRect(tabs->mapToGlobal(QPoint(0, 0)), tabs->size());
    } else {
        geometry = QRect(cascadePosition(), m_config.defaultFloatingSize);
    }
    geometry.setHeight(geometry.height() + m_config.titleBarHeight);

    captureSizes(window);
    // The emptied slot is dropped by simplification.
    const Utils::Result replaced = m_model.replaceInParent(window, group, makeTabGroup());
    if (!replaced)
        return replaced;

    const QList<DockPanel*> panels = allPanels(group);
    DockContainer* container = createContainer(WindowKind::Floating);
    m_model.setRoot(container, group);
    container->setGeometry(geometry);
    renderContainer(container);
    container->show();
    bringToFront(container);

    reconcile(window);

    for (DockPanel* panel : panels)
        emit widgetUndocked(panel);
    emitLayoutChanged();
    return Utils::Result::success();
}

Utils::Result DockingManager::moveWidgetToContainer(DockPanel* panel, DockContainer* container)
{
    const HostInfo host = m_model.findHost(panel);
    if (!host.isValid())
        return untracked(describePanel(panel));
    if (!container || !m_model.contains(container))
        return untracked(u"Target window"_s);
    if (host.window == container)
        return Utils::Result::success();
    return dockWidget(panel, container, DockLocation::Center);
}

Utils::Result DockingManager::closeWidget(DockPanel* panel)
{
    if (!m_model.findHost(panel).isValid())
        return untracked(describePanel(panel));

    // Listeners may still query the layout while handling this.
    QPointer<DockPanel> guard(panel);
    emit widgetClosed(panel->persistentId());
    if (!guard)
        return Utils::Result::success();

    const HostInfo host = m_model.findHost(panel);
    if (!host.isValid())
        return Utils::Result::success();

    captureSizes(host.window);
    m_model.removeWidget(panel);
    discardPanels({panel});
    reconcile(host.window);
    emitLayoutChanged();
    return Utils::Result::success();
}

Utils::Result DockingManager::closeContainer(DockContainer* container)
{
    if (!container || !m_model.contains(container))
        return untracked(u"Window"_s);

    QPointer<DockContainer> guard(container);
    for (DockPanel* panel : panelsOf(container))
        emit widgetClosed(panel->persistentId());
    if (!guard || !m_model.contains(container)) {
        emitLayoutChanged();
        return Utils::Result::success();
    }

    const QList<DockPanel*> remaining = panelsOf(container);
    if (container->isPersistentRoot()) {
        m_model.resetRoot(container);
        discardPanels(remaining);
        renderContainer(container);
    } else {
        m_model.unregisterRoot(container);
        discardPanels(remaining);
        closeWindowSilently(container);
    }
    emitLayoutChanged();
    return Utils::Result::success();
}

Utils::Result DockingManager::closeTabGroup(DockTabWidget* tabs)
{
    TabGroupNodePtr group;
    DockContainer* window = windowOfTabs(tabs, &group);
    if (!window)
        return untracked(u"Tab group"_s);

    QPointer<DockContainer> guard(window);
    const QList<DockPanel*> panels = allPanels(group);
    for (DockPanel* panel : panels)
        emit widgetClosed(panel->persistentId());
    if (!guard || !m_model.contains(window)) {
        emitLayoutChanged();
        return Utils::Result::success();
    }

    captureSizes(window);
    QList<DockPanel*> removed;
    for (DockPanel* panel : allPanels(group)) {
        if (m_model.removeWidget(panel))
            removed.push_back(panel);
    }
    discardPanels(removed);
    reconcile(window);
    emitLayoutChanged();
    return Utils::Result::success();
}

Utils::Result DockingManager::activateWidget(DockPanel* panel)
{
    const HostInfo host = m_model.findHost(panel);
    if (!host.isValid())
        return untracked(describePanel(panel));

    if (DockTabWidget* tabs = host.window->routes().tabsFor(panel))
        tabs->setCurrentWidget(panel);

    QWidget* topLevel = host.window->window();
    if (topLevel->isVisible()) {
        topLevel->raise();
        topLevel->activateWindow();
    }
    bringToFront(host.window);
    return Utils::Result::success();
}

Utils::Result DockingManager::reorderTab(DockTabWidget* tabs, int from, int to)
{
    TabGroupNodePtr group;
    if (!windowOfTabs(tabs, &group))
        return untracked(u"Tab group"_s);

    const int count = int(group->children.size());
    if (from < 0 || from >= count || to < 0 || to >= count)
        return Utils::Result::failure(u"Tab index out of range (%1 -> %2 of %3)."_s.arg(from).arg(to).arg(count));
    if (from == to)
        return Utils::Result::success();

    group->children.move(from, to);
    emitLayoutChanged();
    return Utils::Result::success();
}

// Queries --------------------------------------------------------------------

DockPanel* DockingManager::findWidgetById(const QString& persistentId) const
{
    for (DockPanel* panel : m_model.allPanels()) {
        if (panel->persistentId() == persistentId)
            return panel;
    }
    return nullptr;
}

QList<DockPanel*> DockingManager::listAllWidgets() const
{
    return m_model.allPanels();
}

QList<DockPanel*> DockingManager::listFloatingWidgets() const
{
    QList<DockPanel*> out;
    for (DockContainer* window : m_model.windows()) {
        if (window->kind() == WindowKind::Floating)
            out += panelsOf(window);
    }
    return out;
}

DockContainer* DockingManager::containerOf(const DockPanel* panel) const
{
    return m_model.findHost(panel).window;
}

QList<DockPanel*> DockingManager::panelsOf(const DockContainer* container) const
{
    const auto root = m_model.root(container);
    return root ? allPanels(*root) : QList<DockPanel*>{};
}

QList<DockContainer*> DockingManager::windowStack() const
{
    QList<DockContainer*> out;
    for (const QPointer<DockContainer>& window : m_windowStack) {
        if (window && m_model.contains(window))
            out.push_back(window.data());
    }
    return out;
}

void DockingManager::bringToFront(DockContainer* container)
{
    if (!container)
        return;
    m_windowStack.removeAll(container);
    m_windowStack.prepend(container);
    if (container->isWindow() && container->isVisible())
        container->raise();
}

// Persistence ----------------------------------------------------------------

QByteArray DockingManager::saveLayout()
{
    LayoutSerializer serializer(*this);
    return serializer.save();
}

Utils::Result DockingManager::loadLayout(const QByteArray& data)
{
    LayoutSerializer serializer(*this);
    return serializer.load(data);
}

QJsonObject DockingManager::saveLayoutObject()
{
    LayoutSerializer serializer(*this);
    return serializer.serialize();
}

Utils::Result DockingManager::loadLayoutObject(const QJsonObject& layout)
{
    LayoutSerializer serializer(*this);
    return serializer.deserialize(layout);
}

Utils::Result DockingManager::saveLayoutToFile(const QString& path)
{
    return Utils::JsonFileUtils::writeObjectAtomic(path, saveLayoutObject());
}

Utils::Result DockingManager::loadLayoutFromFile(const QString& path)
{
    QString error;
    const QJsonObject object = Utils::JsonFileUtils::readObject(path, &error);
    if (!error.isEmpty())
        return Utils::Result::failure(error);
    return loadLayoutObject(object);
}

void DockingManager::clearLayout()
{
    m_drag.cancel();
    for (DockContainer* window : m_model.windows()) {
        const QList<DockPanel*> panels = panelsOf(window);
        if (window->isPersistentRoot()) {
            m_model.resetRoot(window);
            discardPanels(panels);
            renderContainer(window);
        } else {
            m_model.unregisterRoot(window);
            discardPanels(panels);
            closeWindowSilently(window);
        }
    }
}

// Input ----------------------------------------------------------------------

bool DockingManager::beginWindowDrag(DockContainer* container, const QPoint& globalPos)
{
    if (!container || !m_model.contains(container) || container->isMainDockArea())
        return false;
    if (!m_state.tryEnter(DockingState::DraggingWindow))
        return false;

    if (container->isMaximizedState()) {
        container->setMaximizedState(false);
        m_dragOffset = QPoint(container->width() / 2, m_config.titleBarHeight / 2);
    } else {
        m_dragOffset = globalPos - container->pos();
    }
    m_dragWindow = container;
    bringToFront(container);

    // Persistent roots only move.
    if (!container->isPersistentRoot()) {
        DragSource source;
        source.window = container;
        source.exclude = container;
        source.simple = m_drag.isSimpleWindow(container);
        m_drag.begin(source, windowStack());
    }
    return true;
}

void DockingManager::updateWindowDrag(const QPoint& globalPos)
{
    if (m_state.state() != DockingState::DraggingWindow || !m_dragWindow)
        return;
    m_dragWindow->move(globalPos - m_dragOffset);
    if (m_drag.isActive())
        m_drag.update(globalPos);
}

void DockingManager::endWindowDrag(const QPoint& globalPos)
{
    if (m_state.state() != DockingState::DraggingWindow)
        return;

    const QPointer<DockContainer> window = std::exchange(m_dragWindow, nullptr);
    PendingDrop drop;
    if (m_drag.isActive()) {
        m_drag.update(globalPos);
        drop = m_drag.finish();
    }
    m_state.leave(DockingState::DraggingWindow);

    // Without a target the window simply stays where it was moved.
    if (!window || !drop.isValid())
        return;

    DockSource source;
    source.window = window;
    report(commitPendingDrop(source, drop), "Dock window");
}

bool DockingManager::beginResize(DockContainer* container)
{
    if (!container || !m_model.contains(container))
        return false;
    return m_state.tryEnter(DockingState::Resizing);
}

void DockingManager::endResize(DockContainer* container)
{
    Q_UNUSED(container);
    m_state.leave(DockingState::Resizing);
}

void DockingManager::startNativeTabDrag(DockPanel* panel)
{
    DockContainer* origin = containerOf(panel);
    if (!origin)
        return;
    if (!m_state.tryEnter(DockingState::DraggingTab))
        return;

    DragSource source;
    source.window = origin;
    source.panel = panel;
    source.simple = m_drag.isSimpleWindow(origin);
    if (source.simple)
        source.exclude = origin;
    m_drag.begin(source, windowStack());

    m_nativeDragPanel = panel;
    m_nativeDropHandled = false;
    const QPointer<DockPanel> guard(panel);

    UTILS_DEFER(
        m_drag.cancel();
        m_nativeDragPanel = nullptr;
        m_state.leave(DockingState::DraggingTab)
    );

    auto* mime = new QMimeData();
    mime->setData(QString::fromLatin1(Constants::kPanelMimeType), panel->persistentId().toUtf8());

    auto* drag = new QDrag(this);
    drag->setMimeData(mime);
    if (panel->isVisible())
        drag->setPixmap(panel->grab().scaledToWidth(qMin(panel->width(), 240), Qt::SmoothTransformation));

    const Qt::DropAction action = drag->exec(Qt::MoveAction);
    if (action != Qt::IgnoreAction || m_nativeDropHandled || !guard)
        return;

    // Released over nothing: the content floats where it was dropped.
    m_drag.cancel();
    const HostInfo host = m_model.findHost(panel);
    if (!host.isValid())
        return;

    QSize size = floatingSizeFor(panel, m_config.defaultFloatingSize);
    size.rheight() += m_config.titleBarHeight;
    const QPoint pos = QCursor::pos() - QPoint(size.width() / 2, m_config.titleBarHeight / 2);

    const auto root = m_model.root(host.window);
    const auto rootGroup = asTabGroup(*root);
    if (!host.window->isPersistentRoot() && rootGroup && rootGroup->children.size() == 1) {
        host.window->move(pos);
        return;
    }

    detachAsFloating(host, QRect(pos, size));
    emit widgetUndocked(panel);
    emitLayoutChanged();
}

void DockingManager::updateNativeDrag(const QPoint& globalPos)
{
    if (m_state.state() == DockingState::DraggingTab && m_drag.isActive())
        m_drag.update(globalPos);
}

bool DockingManager::finishNativeDrop(const QPoint& globalPos)
{
    if (m_state.state() != DockingState::DraggingTab || !m_drag.isActive())
        return false;

    m_drag.update(globalPos);
    const PendingDrop drop = m_drag.finish();
    if (!drop.isValid() || !m_nativeDragPanel)
        return false;

    DockSource source;
    source.panel = m_nativeDragPanel;
    const Utils::Result result = commitPendingDrop(source, drop);
    report(result, "Drop tab");
    m_nativeDropHandled = result.ok;
    return result.ok;
}

// Helpers --------------------------------------------------------------------

QPoint DockingManager::cascadePosition()
{
    QPoint origin;
    for (DockContainer* window : m_model.windows()) {
        if (window->isMainDockArea()) {
            origin = window->window()->pos();
            break;
        }
    }
    const int slot = m_cascadeCount++ % qMax(1, m_config.cascadeSlots);
    const int offset = m_config.cascadeOriginPx + slot * m_config.cascadeStepPx;
    return origin + QPoint(offset, offset);
}

QSize DockingManager::floatingSizeFor(const DockPanel* panel, const QSize& fallback) const
{
    if (panel && panel->isVisible() && panel->width() > 0 && panel->height() > 0)
        return panel->size();
    return fallback;
}

void DockingManager::discardPanels(const QList<DockPanel*>& panels)
{
    for (DockPanel* panel : panels) {
        if (!panel)
            continue;
        DockOverlay::destroyFor(panel);
        panel->hide();
        panel->setParent(nullptr);
        panel->deleteLater();
    }
}

void DockingManager::emitLayoutChanged()
{
    if (m_debugMode)
        qCInfo(dockinglog).noquote() << m_model.dump();
    emit layoutChanged();
}

void DockingManager::report(const Utils::Result& result, const char* operation) const
{
    if (result)
        return;
    qCWarning(dockinglog).noquote() << operation << "failed:" << result.joined(u"; "_s);
}

} // namespace Docking
