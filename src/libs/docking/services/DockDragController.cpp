// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/services/DockDragController.hpp"

#include "docking/model/LayoutModel.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/DockTabBar.hpp"
#include "docking/widgets/DockTabWidget.hpp"

namespace Docking {

DockDragController::DockDragController(const LayoutModel* model)
    : m_model(model)
{
}

void DockDragController::begin(const DragSource& source, const QList<DockContainer*>& windowStack)
{
    tearDown();

    m_source = source;
    m_stack.clear();
    for (DockContainer* window : windowStack)
        m_stack.push_back(window);
    m_cache.build(windowStack, source.exclude.data());
    m_active = true;

    qCDebug(dockingdraglog) << "Drag started; source simple:" << source.simple;
}

bool DockDragController::isSimpleWindow(const DockContainer* window) const
{
    if (!m_model || !window)
        return false;
    const auto root = m_model->root(window);
    if (!root)
        return false;
    const auto group = asTabGroup(*root);
    return group && group->children.size() == 1;
}

bool DockDragController::isEmptyPersistentRoot(const DockContainer* window) const
{
    if (!m_model || !window || !window->isPersistentRoot())
        return false;
    const auto root = m_model->root(window);
    return root && isEmptyPane(*root);
}

void DockDragController::update(const QPoint& globalPos)
{
    if (!m_active)
        return;

    if (!m_cache.isValid()) {
        QList<DockContainer*> stack;
        for (const QPointer<DockContainer>& window : m_stack) {
            if (window)
                stack.push_back(window.data());
        }
        m_cache.build(stack, m_source.exclude.data());
    }

    const DockContainer* exclude = m_source.exclude.data();

    if (const auto tabHit = m_cache.findTabBarAt(globalPos, exclude)) {
        applyOverlays({});
        setTabIndicator(tabHit->tabs.data(), tabHit->index);
        m_pending = PendingDrop{};
        m_pending.kind = PendingDrop::Kind::TabInsert;
        m_pending.tabs = tabHit->tabs;
        m_pending.index = tabHit->index;
        return;
    }
    setTabIndicator(nullptr, -1);

    DockPanel* targetPanel = nullptr;
    DockContainer* targetWindow = nullptr;
    if (const HitTestEntry* hit = m_cache.findDropTargetAt(globalPos, exclude)) {
        targetWindow = hit->container();
        targetPanel = hit->panel();
        if (targetPanel && targetPanel == m_source.panel.data())
            targetPanel = nullptr;
    }

    QList<OverlayRequest> wanted;
    if (targetPanel) {
        wanted.push_back({targetPanel, OverlayStyle::Cluster, OverlayPreset::Standard});
        if (targetWindow && !(m_source.simple && isSimpleWindow(targetWindow)))
            wanted.push_back({targetWindow, OverlayStyle::Spread, OverlayPreset::Standard});
    } else if (targetWindow) {
        const OverlayPreset preset = isEmptyPersistentRoot(targetWindow) ? OverlayPreset::MainEmpty
                                                                        : OverlayPreset::Standard;
        wanted.push_back({targetWindow, OverlayStyle::Spread, preset});
    }
    applyOverlays(wanted);

    // The widget overlay is the more specific one, so it answers first.
    m_pending = PendingDrop{};
    for (const OverlayRequest& request : wanted) {
        DockOverlay* overlay = DockOverlay::overlayFor(request.owner);
        if (!overlay)
            continue;
        std::optional<DockLocation> location;
        if (!m_pending.isValid())
            location = overlay->locationAt(globalPos);
        overlay->showPreview(location);
        if (location) {
            m_pending.kind = PendingDrop::Kind::Dock;
            m_pending.target = request.owner;
            m_pending.location = *location;
        }
    }
}

void DockDragController::applyOverlays(const QList<OverlayRequest>& wanted)
{
    QList<QWidget*> wantedOwners;
    for (const OverlayRequest& request : wanted)
        wantedOwners.push_back(request.owner);

    for (const QPointer<QWidget>& owner : std::as_const(m_shown)) {
        if (!owner || wantedOwners.contains(owner.data()))
            continue;
        if (DockOverlay* overlay = DockOverlay::overlayFor(owner)) {
            overlay->showPreview(std::nullopt);
            overlay->hide();
        }
    }

    m_shown.clear();
    for (const OverlayRequest& request : wanted) {
        DockOverlay* overlay = DockOverlay::ensureFor(request.owner, request.style, m_metrics);
        if (!overlay)
            continue;
        overlay->setPreset(request.preset);
        overlay->syncToOwner();
        overlay->show();
        m_shown.push_back(request.owner);
        if (!m_touched.contains(request.owner))
            m_touched.push_back(request.owner);
    }
}

void DockDragController::setTabIndicator(DockTabWidget* tabs, int index)
{
    if (m_indicatorTabs && m_indicatorTabs.data() != tabs)
        m_indicatorTabs->dockTabBar()->setDropIndicatorIndex(-1);
    m_indicatorTabs = tabs;
    if (tabs)
        tabs->dockTabBar()->setDropIndicatorIndex(index);
}

QList<QWidget*> DockDragController::shownOverlayOwners() const
{
    QList<QWidget*> out;
    for (const QPointer<QWidget>& owner : m_shown) {
        if (owner)
            out.push_back(owner.data());
    }
    return out;
}

PendingDrop DockDragController::finish()
{
    const PendingDrop pending = m_pending;
    tearDown();
    return pending;
}

void DockDragController::cancel()
{
    tearDown();
}

void DockDragController::tearDown()
{
    for (const QPointer<QWidget>& owner : std::as_const(m_touched)) {
        if (owner)
            DockOverlay::destroyFor(owner.data());
    }
    m_touched.clear();
    m_shown.clear();
    setTabIndicator(nullptr, -1);
    m_cache.invalidate();
    m_pending = PendingDrop{};
    m_source = DragSource{};
    m_stack.clear();
    m_active = false;
}

} // namespace Docking
