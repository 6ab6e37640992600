// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "DockingTestSupport.hpp"

#include "docking/model/LayoutModel.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockPanel.hpp"

#include <memory>

using namespace Docking;

namespace {

std::unique_ptr<DockPanel> makePanel(const QString& id)
{
    return std::make_unique<DockPanel>(DockingTests::makeContent(id), id, id);
}

} // namespace

TEST(LayoutModelTests, RegisteredRootsKeepRegistrationOrder)
{
    DockingTests::ensureApp();

    DockContainer first(nullptr, WindowKind::Floating);
    DockContainer second(nullptr, WindowKind::MainDockArea);
    auto panel = makePanel(QStringLiteral("editor"));

    LayoutModel model;
    model.registerRoot(&first, panel.get());
    model.registerEmptyRoot(&second);

    EXPECT_EQ(model.rootCount(), 2);
    EXPECT_EQ(model.windows(), (QList<DockContainer*>{&first, &second}));
    EXPECT_TRUE(model.contains(&second));
    EXPECT_EQ(model.allPanels(), QList<DockPanel*>{panel.get()});

    const auto root = model.root(&second);
    ASSERT_TRUE(root.has_value());
    EXPECT_TRUE(isEmptyPane(*root));
}

TEST(LayoutModelTests, FindHostLocatesTheOwningGroup)
{
    DockingTests::ensureApp();

    DockContainer window(nullptr, WindowKind::Floating);
    auto a = makePanel(QStringLiteral("a"));
    auto b = makePanel(QStringLiteral("b"));
    auto c = makePanel(QStringLiteral("c"));

    const TabGroupNodePtr left = makeTabGroup({makeWidgetNode(a.get())});
    const TabGroupNodePtr right = makeTabGroup({makeWidgetNode(b.get()), makeWidgetNode(c.get())});
    const SplitterNodePtr splitter = makeSplitter(Qt::Horizontal, {left, right});

    LayoutModel model;
    model.setRoot(&window, splitter);

    const HostInfo host = model.findHost(c.get());
    ASSERT_TRUE(host.isValid());
    EXPECT_EQ(host.group, right);
    EXPECT_EQ(host.parent, splitter);
    EXPECT_EQ(host.window, &window);
    EXPECT_EQ(host.index, 1);

    EXPECT_EQ(model.windowOfGroup(left), &window);
    EXPECT_EQ(model.allPanels(), (QList<DockPanel*>{a.get(), b.get(), c.get()}));
    EXPECT_EQ(model.findWidgetNode(b.get())->panel.data(), b.get());

    auto stranger = makePanel(QStringLiteral("stranger"));
    EXPECT_FALSE(model.findHost(stranger.get()).isValid());
    EXPECT_EQ(model.windowOfGroup(makeTabGroup()), nullptr);
}

TEST(LayoutModelTests, RemoveWidgetLeavesTheEmptyGroupForSimplification)
{
    DockingTests::ensureApp();

    DockContainer window(nullptr, WindowKind::Floating);
    auto a = makePanel(QStringLiteral("a"));
    auto b = makePanel(QStringLiteral("b"));

    const TabGroupNodePtr left = makeTabGroup({makeWidgetNode(a.get())});
    const TabGroupNodePtr right = makeTabGroup({makeWidgetNode(b.get())});

    LayoutModel model;
    model.setRoot(&window, makeSplitter(Qt::Vertical, {left, right}));

    EXPECT_EQ(model.removeWidget(a.get()), &window);
    EXPECT_TRUE(left->children.isEmpty());
    EXPECT_EQ(model.removeWidget(a.get()), nullptr);
    EXPECT_EQ(model.allPanels(), QList<DockPanel*>{b.get()});
}

TEST(LayoutModelTests, ReplaceInParentRejectsForeignNodes)
{
    DockingTests::ensureApp();

    DockContainer window(nullptr, WindowKind::Floating);
    auto a = makePanel(QStringLiteral("a"));
    const TabGroupNodePtr group = makeTabGroup({makeWidgetNode(a.get())});

    LayoutModel model;
    model.setRoot(&window, group);

    const SplitterNodePtr splitter = makeSplitter(Qt::Horizontal, {group, makeTabGroup()});
    ASSERT_TRUE(model.replaceInParent(&window, group, splitter).ok);
    EXPECT_EQ(asSplitter(*model.root(&window)), splitter);

    EXPECT_FALSE(model.replaceInParent(&window, makeTabGroup(), makeTabGroup()).ok);

    DockContainer unknown(nullptr, WindowKind::Floating);
    EXPECT_FALSE(model.replaceInParent(&unknown, group, makeTabGroup()).ok);
}

TEST(LayoutModelTests, PruneDropsDestroyedPanelsAndWindows)
{
    DockingTests::ensureApp();

    auto keep = makePanel(QStringLiteral("keep"));
    auto* doomed = new DockPanel(DockingTests::makeContent(QStringLiteral("doomed")),
                                 QStringLiteral("doomed"), QStringLiteral("doomed"));

    DockContainer window(nullptr, WindowKind::Floating);
    auto* closing = new DockContainer(nullptr, WindowKind::Floating);

    LayoutModel model;
    model.setRoot(&window, makeTabGroup({makeWidgetNode(keep.get()), makeWidgetNode(doomed)}));
    model.registerEmptyRoot(closing);

    delete doomed;
    delete closing;

    const QList<DockContainer*> changed = model.pruneDead();
    EXPECT_EQ(changed, QList<DockContainer*>{&window});
    EXPECT_EQ(model.rootCount(), 1);
    EXPECT_EQ(model.allPanels(), QList<DockPanel*>{keep.get()});
}

TEST(LayoutModelTests, ResetAndUnregister)
{
    DockingTests::ensureApp();

    DockContainer window(nullptr, WindowKind::FloatingRoot);
    auto a = makePanel(QStringLiteral("a"));

    LayoutModel model;
    model.registerRoot(&window, a.get());

    const TabGroupNodePtr fresh = model.resetRoot(&window);
    ASSERT_TRUE(fresh);
    EXPECT_TRUE(model.allPanels().isEmpty());
    EXPECT_TRUE(model.dump().contains(QStringLiteral("persistent")));

    EXPECT_TRUE(model.unregisterRoot(&window));
    EXPECT_FALSE(model.unregisterRoot(&window));
    EXPECT_FALSE(model.resetRoot(&window));
    EXPECT_FALSE(model.root(&window).has_value());
}
