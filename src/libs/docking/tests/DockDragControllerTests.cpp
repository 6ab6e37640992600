// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "DockingTestSupport.hpp"

#include "docking/model/LayoutModel.hpp"
#include "docking/services/DockDragController.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockOverlay.hpp"
#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/DockTabBar.hpp"
#include "docking/widgets/DockTabWidget.hpp"

#include <memory>

using namespace Docking;

namespace {

std::unique_ptr<DockPanel> makePanel(const QString& id)
{
    return std::make_unique<DockPanel>(DockingTests::makeContent(id), id, id);
}

HitTestEntry entryFor(HitTestEntry::Kind kind, const QRect& rect, QWidget* widget, DockContainer* window, int z)
{
    HitTestEntry entry;
    entry.kind = kind;
    entry.globalRect = rect;
    entry.widget = widget;
    entry.window = window;
    entry.zOrder = z;
    return entry;
}

// Target window at z 0 whose body covers (0,0 400x300) and whose single panel
// covers everything below a 30 px tab strip.
void addWindowEntries(HitTestCache& cache, DockContainer* window, DockPanel* panel, const QPoint& origin, int z)
{
    cache.addEntry(entryFor(HitTestEntry::Kind::Container, QRect(origin, QSize(400, 300)), window, window, z));
    cache.addEntry(entryFor(HitTestEntry::Kind::Panel, QRect(origin + QPoint(0, 30), QSize(400, 270)), panel, window, z));
}

QPoint iconCenter(const QWidget* owner, DockLocation location)
{
    const DockOverlay* overlay = DockOverlay::overlayFor(owner);
    return overlay ? overlay->mapToGlobal(overlay->iconRects().value(location).center()) : QPoint();
}

bool overlayShown(const QWidget* owner)
{
    const DockOverlay* overlay = DockOverlay::overlayFor(owner);
    return overlay && !overlay->isHidden();
}

} // namespace

TEST(DockDragControllerTests, ClassifiesSimpleWindowsAndEmptyRoots)
{
    DockingTests::ensureApp();

    DockContainer single(nullptr, WindowKind::Floating);
    DockContainer tabbed(nullptr, WindowKind::Floating);
    DockContainer emptyMain(nullptr, WindowKind::MainDockArea);
    auto a = makePanel(QStringLiteral("a"));
    auto b = makePanel(QStringLiteral("b"));
    auto c = makePanel(QStringLiteral("c"));

    LayoutModel model;
    model.registerRoot(&single, a.get());
    model.setRoot(&tabbed, makeTabGroup({makeWidgetNode(b.get()), makeWidgetNode(c.get())}));
    model.registerEmptyRoot(&emptyMain);

    DockDragController controller(&model);
    EXPECT_TRUE(controller.isSimpleWindow(&single));
    EXPECT_FALSE(controller.isSimpleWindow(&tabbed));
    EXPECT_FALSE(controller.isSimpleWindow(&emptyMain));
    EXPECT_FALSE(controller.isSimpleWindow(nullptr));

    EXPECT_TRUE(controller.isEmptyPersistentRoot(&emptyMain));
    EXPECT_FALSE(controller.isEmptyPersistentRoot(&single));
}

TEST(DockDragControllerTests, FinishWithoutTargetYieldsNoDrop)
{
    DockingTests::ensureApp();

    DockContainer window(nullptr, WindowKind::Floating);
    auto a = makePanel(QStringLiteral("a"));

    LayoutModel model;
    model.registerRoot(&window, a.get());

    DockDragController controller(&model);
    DragSource source;
    source.window = &window;
    source.exclude = &window;
    source.simple = true;
    controller.begin(source, {&window});
    EXPECT_TRUE(controller.isActive());
    EXPECT_TRUE(controller.cache().isValid());

    controller.update(QPoint(-4000, -4000));
    EXPECT_TRUE(controller.shownOverlayOwners().isEmpty());

    const PendingDrop drop = controller.finish();
    EXPECT_FALSE(drop.isValid());
    EXPECT_FALSE(controller.isActive());
    EXPECT_FALSE(controller.cache().isValid());
}

TEST(DockDragControllerTests, TabBarHitShowsOnlyTheInsertionIndicator)
{
    DockingTests::ensureApp();

    DockContainer target(nullptr, WindowKind::Floating);
    DockTabWidget tabs;
    auto b = makePanel(QStringLiteral("b"));

    LayoutModel model;
    model.registerRoot(&target, b.get());

    DockDragController controller(&model);
    DragSource source;
    source.simple = true;
    controller.begin(source, {});

    addWindowEntries(controller.cache(), &target, b.get(), QPoint(0, 0), 0);
    HitTestEntry bar = entryFor(HitTestEntry::Kind::TabBar, QRect(0, 0, 400, 30), &tabs, &target, 0);
    bar.tabRects = {QRect(0, 0, 100, 30), QRect(100, 0, 100, 30)};
    controller.cache().addEntry(bar);

    controller.update(QPoint(200, 200));
    EXPECT_EQ(controller.shownOverlayOwners(), QList<QWidget*>{b.get()});

    controller.update(QPoint(120, 10));
    EXPECT_TRUE(controller.shownOverlayOwners().isEmpty());
    EXPECT_FALSE(overlayShown(b.get()));
    EXPECT_EQ(tabs.dockTabBar()->dropIndicatorIndex(), 1);
    EXPECT_EQ(controller.pending().kind, PendingDrop::Kind::TabInsert);
    EXPECT_EQ(controller.pending().tabs.data(), &tabs);
    EXPECT_EQ(controller.pending().index, 1);

    controller.update(QPoint(350, 10));
    EXPECT_EQ(tabs.dockTabBar()->dropIndicatorIndex(), 2);

    controller.update(QPoint(200, 200));
    EXPECT_EQ(tabs.dockTabBar()->dropIndicatorIndex(), -1);
    EXPECT_NE(controller.pending().kind, PendingDrop::Kind::TabInsert);

    controller.update(QPoint(20, 10));
    const PendingDrop drop = controller.finish();
    ASSERT_TRUE(drop.isValid());
    EXPECT_EQ(drop.kind, PendingDrop::Kind::TabInsert);
    EXPECT_EQ(drop.index, 0);
    EXPECT_EQ(tabs.dockTabBar()->dropIndicatorIndex(), -1);
    EXPECT_EQ(DockOverlay::overlayFor(b.get()), nullptr);
}

TEST(DockDragControllerTests, ContainerOverlayIsSkippedOnlyForSimpleOverSimple)
{
    DockingTests::ensureApp();

    DockContainer simpleTarget(nullptr, WindowKind::Floating);
    DockContainer tabbedTarget(nullptr, WindowKind::Floating);
    auto b = makePanel(QStringLiteral("b"));
    auto c = makePanel(QStringLiteral("c"));
    auto d = makePanel(QStringLiteral("d"));

    LayoutModel model;
    model.registerRoot(&simpleTarget, b.get());
    model.setRoot(&tabbedTarget, makeTabGroup({makeWidgetNode(c.get()), makeWidgetNode(d.get())}));

    DockDragController controller(&model);
    auto startDrag = [&](bool simple) {
        DragSource source;
        source.simple = simple;
        controller.begin(source, {});
        addWindowEntries(controller.cache(), &simpleTarget, b.get(), QPoint(0, 0), 0);
        addWindowEntries(controller.cache(), &tabbedTarget, c.get(), QPoint(1000, 0), 1);
    };

    startDrag(true);
    controller.update(QPoint(200, 200));
    EXPECT_EQ(controller.shownOverlayOwners(), QList<QWidget*>{b.get()});
    ASSERT_NE(DockOverlay::overlayFor(b.get()), nullptr);
    EXPECT_EQ(DockOverlay::overlayFor(b.get())->style(), OverlayStyle::Cluster);
    EXPECT_EQ(DockOverlay::overlayFor(&simpleTarget), nullptr);

    controller.update(QPoint(1200, 200));
    EXPECT_EQ(controller.shownOverlayOwners(), (QList<QWidget*>{c.get(), &tabbedTarget}));
    controller.cancel();

    startDrag(false);
    controller.update(QPoint(200, 200));
    EXPECT_EQ(controller.shownOverlayOwners(), (QList<QWidget*>{b.get(), &simpleTarget}));
    ASSERT_NE(DockOverlay::overlayFor(&simpleTarget), nullptr);
    EXPECT_EQ(DockOverlay::overlayFor(&simpleTarget)->style(), OverlayStyle::Spread);

    // Over the tab strip area without a tab-bar entry only the body is hit.
    controller.update(QPoint(200, 10));
    EXPECT_EQ(controller.shownOverlayOwners(), QList<QWidget*>{&simpleTarget});
    controller.cancel();
    EXPECT_EQ(DockOverlay::overlayFor(&simpleTarget), nullptr);
}

TEST(DockDragControllerTests, OverlaysFollowTheHoveredTarget)
{
    DockingTests::ensureApp();

    DockContainer first(nullptr, WindowKind::Floating);
    DockContainer second(nullptr, WindowKind::Floating);
    auto b = makePanel(QStringLiteral("b"));
    auto c = makePanel(QStringLiteral("c"));

    LayoutModel model;
    model.registerRoot(&first, b.get());
    model.registerRoot(&second, c.get());

    DockDragController controller(&model);
    DragSource source;
    controller.begin(source, {});
    addWindowEntries(controller.cache(), &first, b.get(), QPoint(0, 0), 0);
    addWindowEntries(controller.cache(), &second, c.get(), QPoint(1000, 0), 1);

    controller.update(QPoint(200, 200));
    EXPECT_TRUE(overlayShown(b.get()));
    EXPECT_TRUE(overlayShown(&first));

    controller.update(QPoint(1200, 200));
    EXPECT_EQ(controller.shownOverlayOwners(), (QList<QWidget*>{c.get(), &second}));
    EXPECT_TRUE(overlayShown(c.get()));
    EXPECT_TRUE(overlayShown(&second));
    ASSERT_NE(DockOverlay::overlayFor(b.get()), nullptr);
    EXPECT_FALSE(overlayShown(b.get()));
    EXPECT_FALSE(overlayShown(&first));

    DockOverlay* reused = DockOverlay::overlayFor(b.get());
    controller.update(QPoint(200, 200));
    EXPECT_EQ(DockOverlay::overlayFor(b.get()), reused);
    EXPECT_TRUE(overlayShown(b.get()));
    EXPECT_FALSE(overlayShown(c.get()));

    controller.update(QPoint(-4000, -4000));
    EXPECT_TRUE(controller.shownOverlayOwners().isEmpty());
    EXPECT_FALSE(overlayShown(b.get()));

    controller.finish();
    EXPECT_EQ(DockOverlay::overlayFor(b.get()), nullptr);
    EXPECT_EQ(DockOverlay::overlayFor(c.get()), nullptr);
    EXPECT_EQ(DockOverlay::overlayFor(&first), nullptr);
    EXPECT_EQ(DockOverlay::overlayFor(&second), nullptr);
}

TEST(DockDragControllerTests, WidgetOverlayAnswersBeforeTheWindowOverlay)
{
    DockingTests::ensureApp();

    DockContainer target(nullptr, WindowKind::Floating);
    target.setGeometry(0, 0, 400, 300);
    auto b = makePanel(QStringLiteral("b"));
    auto c = makePanel(QStringLiteral("c"));
    b->setGeometry(2000, 2000, 300, 200);

    LayoutModel model;
    model.setRoot(&target, makeTabGroup({makeWidgetNode(b.get()), makeWidgetNode(c.get())}));

    DockDragController controller(&model);
    DragSource source;
    source.simple = true;
    controller.begin(source, {});

    // Both regions cover any point the overlays can map to.
    controller.cache().addEntry(
        entryFor(HitTestEntry::Kind::Container, QRect(-6000, -6000, 12000, 12000), &target, &target, 0));
    controller.cache().addEntry(
        entryFor(HitTestEntry::Kind::Panel, QRect(-5000, -5000, 10000, 10000), b.get(), &target, 0));

    controller.update(QPoint(-4999, -4999));
    ASSERT_EQ(controller.shownOverlayOwners(), (QList<QWidget*>{b.get(), &target}));
    EXPECT_FALSE(controller.pending().isValid());

    controller.update(iconCenter(b.get(), DockLocation::Center));
    ASSERT_TRUE(controller.pending().isValid());
    EXPECT_EQ(controller.pending().kind, PendingDrop::Kind::Dock);
    EXPECT_EQ(controller.pending().target.data(), b.get());
    EXPECT_EQ(controller.pending().location, DockLocation::Center);
    EXPECT_EQ(DockOverlay::overlayFor(b.get())->previewLocation(), DockLocation::Center);
    EXPECT_FALSE(DockOverlay::overlayFor(&target)->previewLocation().has_value());

    controller.update(iconCenter(&target, DockLocation::Top));
    ASSERT_TRUE(controller.pending().isValid());
    EXPECT_EQ(controller.pending().target.data(), &target);
    EXPECT_EQ(controller.pending().location, DockLocation::Top);
    EXPECT_FALSE(DockOverlay::overlayFor(b.get())->previewLocation().has_value());
    EXPECT_EQ(DockOverlay::overlayFor(&target)->previewLocation(), DockLocation::Top);

    controller.update(iconCenter(b.get(), DockLocation::Left));
    const PendingDrop drop = controller.finish();
    ASSERT_TRUE(drop.isValid());
    EXPECT_EQ(drop.target.data(), b.get());
    EXPECT_EQ(drop.location, DockLocation::Left);
    EXPECT_EQ(DockOverlay::overlayFor(b.get()), nullptr);
    EXPECT_EQ(DockOverlay::overlayFor(&target), nullptr);
}

TEST(DockDragControllerTests, DraggedPanelIsNotItsOwnTarget)
{
    DockingTests::ensureApp();

    DockContainer target(nullptr, WindowKind::Floating);
    auto b = makePanel(QStringLiteral("b"));
    auto c = makePanel(QStringLiteral("c"));

    LayoutModel model;
    model.setRoot(&target, makeTabGroup({makeWidgetNode(b.get()), makeWidgetNode(c.get())}));

    DockDragController controller(&model);
    DragSource source;
    source.panel = b.get();
    controller.begin(source, {});
    addWindowEntries(controller.cache(), &target, b.get(), QPoint(0, 0), 0);

    controller.update(QPoint(200, 200));
    EXPECT_EQ(controller.shownOverlayOwners(), QList<QWidget*>{&target});
    EXPECT_EQ(DockOverlay::overlayFor(b.get()), nullptr);
    controller.cancel();
}
