// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "DockingTestSupport.hpp"

#include "docking/DockingManager.hpp"
#include "docking/IDockStateful.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/MainDockWindow.hpp"

#include <QtCore/QDir>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>
#include <QtWidgets/QLabel>

#include <stdexcept>

using namespace Docking;

namespace {

using namespace Qt::StringLiterals;

class CounterWidget final : public QLabel, public IDockStateful
{
public:
    int value = 0;

    QJsonObject captureDockState() const override
    {
        QJsonObject state;
        state.insert(u"value"_s, value);
        return state;
    }

    void restoreDockState(const QJsonObject& state) override { value = state.value(u"value"_s).toInt(); }
};

QWidget* makeById(const QString& id)
{
    if (id.startsWith(u"counter"_s))
        return new CounterWidget();
    if (id == u"unknown"_s)
        return nullptr;
    if (id == u"explodes"_s)
        throw std::runtime_error("factory failure");
    return DockingTests::makeContent(id);
}

void installFactory(DockingManager& manager)
{
    manager.setWidgetFactory(&makeById);
}

DockContainer* floatPanel(DockingManager& manager, const QString& id)
{
    return manager.createFloatingWindow(makeById(id), id, id.toUpper());
}

QStringList idsIn(const DockingManager& manager, const DockContainer* window)
{
    QStringList ids;
    const auto root = manager.model().root(window);
    if (!root)
        return ids;
    for (DockPanel* panel : allPanels(*root))
        ids << panel->persistentId();
    return ids;
}

} // namespace

TEST(LayoutSerializerTests, SaveDescribesEveryWindow)
{
    DockingTests::ensureApp();
    DockingManager manager;
    MainDockWindow host(&manager);

    floatPanel(manager, u"a"_s);
    floatPanel(manager, u"b"_s);
    ASSERT_TRUE(manager.dockWidget(manager.findWidgetById(u"b"_s), manager.findWidgetById(u"a"_s),
                                   DockLocation::Right).ok);

    const QJsonObject layout = manager.saveLayoutObject();
    EXPECT_EQ(layout.value(u"version"_s).toInt(), 1);

    const QJsonArray windows = layout.value(u"windows"_s).toArray();
    ASSERT_EQ(windows.size(), 2);

    const QJsonObject main = windows.at(0).toObject();
    EXPECT_EQ(main.value(u"kind"_s).toString(), u"mainDockArea"_s);
    EXPECT_TRUE(main.value(u"isMainWindow"_s).toBool());
    EXPECT_TRUE(main.value(u"isPersistentRoot"_s).toBool());
    EXPECT_EQ(main.value(u"content"_s).toObject().value(u"type"_s).toString(), u"tabgroup"_s);

    const QJsonObject floating = windows.at(1).toObject();
    EXPECT_EQ(floating.value(u"kind"_s).toString(), u"floating"_s);
    EXPECT_FALSE(floating.value(u"isPersistentRoot"_s).toBool());
    const QJsonObject content = floating.value(u"content"_s).toObject();
    EXPECT_EQ(content.value(u"type"_s).toString(), u"splitter"_s);
    EXPECT_EQ(content.value(u"orientation"_s).toString(), u"horizontal"_s);

    const QJsonArray children = content.value(u"children"_s).toArray();
    ASSERT_EQ(children.size(), 2);
    const QJsonObject firstWidget = children.at(0).toObject().value(u"children"_s).toArray().at(0).toObject();
    EXPECT_EQ(firstWidget.value(u"type"_s).toString(), u"widget"_s);
    EXPECT_EQ(firstWidget.value(u"id"_s).toString(), u"a"_s);
    EXPECT_EQ(firstWidget.value(u"margin"_s).toInt(), manager.config().contentMargin);
    EXPECT_FALSE(firstWidget.contains(u"state"_s));
}

TEST(LayoutSerializerTests, RoundTripRebuildsTreesAndState)
{
    DockingTests::ensureApp();
    DockingManager manager;
    installFactory(manager);
    MainDockWindow host(&manager);

    floatPanel(manager, u"m"_s);
    ASSERT_TRUE(manager.moveWidgetToContainer(manager.findWidgetById(u"m"_s), host.dockArea()).ok);

    floatPanel(manager, u"a"_s);
    floatPanel(manager, u"b"_s);
    floatPanel(manager, u"c"_s);
    DockPanel* a = manager.findWidgetById(u"a"_s);
    ASSERT_TRUE(manager.dockWidget(manager.findWidgetById(u"b"_s), a, DockLocation::Left).ok);
    ASSERT_TRUE(manager.dockWidget(manager.findWidgetById(u"c"_s), a, DockLocation::Center).ok);

    floatPanel(manager, u"counter"_s);
    auto* counter = qobject_cast<CounterWidget*>(manager.findWidgetById(u"counter"_s)->content());
    ASSERT_NE(counter, nullptr);
    counter->value = 7;

    const QByteArray saved = manager.saveLayout();
    QSignalSpy changed(&manager, &DockingManager::layoutChanged);
    QSignalSpy closed(&manager, &DockingManager::widgetClosed);
    ASSERT_TRUE(manager.loadLayout(saved).ok);
    EXPECT_GE(changed.count(), 1);
    EXPECT_EQ(closed.count(), 0);

    const QList<DockContainer*> windows = manager.containers();
    ASSERT_EQ(windows.size(), 3);
    EXPECT_EQ(windows.at(0), host.dockArea());
    EXPECT_EQ(idsIn(manager, host.dockArea()), QStringList{u"m"_s});

    DockContainer* restored = manager.containerOf(manager.findWidgetById(u"a"_s));
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->kind(), WindowKind::Floating);
    EXPECT_TRUE(restored->isVisible());
    EXPECT_EQ(idsIn(manager, restored), (QStringList{u"b"_s, u"a"_s, u"c"_s}));
    const auto root = manager.model().root(restored);
    ASSERT_TRUE(root.has_value());
    const SplitterNodePtr splitter = asSplitter(*root);
    ASSERT_TRUE(splitter);
    EXPECT_EQ(splitter->orientation, Qt::Horizontal);
    ASSERT_EQ(splitter->children.size(), 2);
    EXPECT_EQ(asTabGroup(splitter->children.at(1))->children.size(), 2);

    auto* restoredCounter = qobject_cast<CounterWidget*>(manager.findWidgetById(u"counter"_s)->content());
    ASSERT_NE(restoredCounter, nullptr);
    EXPECT_EQ(restoredCounter->value, 7);
}

TEST(LayoutSerializerTests, RegisteredHandlersCarryForeignState)
{
    DockingTests::ensureApp();
    DockingManager manager;
    installFactory(manager);

    auto textOf = [](QWidget* content) {
        QJsonObject state;
        state.insert(u"text"_s, qobject_cast<QLabel*>(content)->text());
        return state;
    };
    auto setText = [](QWidget* content, const QJsonObject& state) {
        qobject_cast<QLabel*>(content)->setText(state.value(u"text"_s).toString());
    };
    manager.registerInstanceStateHandlers(u"plain"_s, textOf, setText);
    manager.registerInstanceStateHandlers(u"bad"_s, textOf, [](QWidget*, const QJsonObject&) {
        throw std::runtime_error("restore failed");
    });

    floatPanel(manager, u"plain"_s);
    floatPanel(manager, u"bad"_s);
    floatPanel(manager, u"after"_s);
    qobject_cast<QLabel*>(manager.findWidgetById(u"plain"_s)->content())->setText(u"edited"_s);

    ASSERT_TRUE(manager.loadLayout(manager.saveLayout()).ok);

    auto* plain = qobject_cast<QLabel*>(manager.findWidgetById(u"plain"_s)->content());
    ASSERT_NE(plain, nullptr);
    EXPECT_EQ(plain->text(), u"edited"_s);
    EXPECT_NE(manager.findWidgetById(u"bad"_s), nullptr);
    EXPECT_NE(manager.findWidgetById(u"after"_s), nullptr);
}

TEST(LayoutSerializerTests, ThrowingProviderStillSaves)
{
    DockingTests::ensureApp();
    DockingManager manager;
    manager.registerInstanceStateHandlers(u"a"_s,
                                          [](QWidget*) -> QJsonObject { throw std::runtime_error("capture failed"); },
                                          {});
    floatPanel(manager, u"a"_s);

    const QJsonArray windows = manager.saveLayoutObject().value(u"windows"_s).toArray();
    ASSERT_EQ(windows.size(), 1);
    const QJsonObject widget = windows.at(0).toObject().value(u"content"_s).toObject()
                                   .value(u"children"_s).toArray().at(0).toObject();
    EXPECT_EQ(widget.value(u"id"_s).toString(), u"a"_s);
    EXPECT_FALSE(widget.contains(u"state"_s));
}

TEST(LayoutSerializerTests, NonStandardExceptionsFromCallbacksAreContained)
{
    DockingTests::ensureApp();
    DockingManager manager;
    manager.setWidgetFactory([](const QString& id) -> QWidget* {
        if (id == u"thrower"_s)
            throw u"no widget"_s;
        return DockingTests::makeContent(id);
    });
    manager.registerInstanceStateHandlers(
        u"a"_s, [](QWidget*) -> QJsonObject { return QJsonObject{{u"k"_s, 1}}; },
        [](QWidget*, const QJsonObject&) { throw 42; });
    manager.registerInstanceStateHandlers(u"b"_s, [](QWidget*) -> QJsonObject { throw 7; }, {});

    floatPanel(manager, u"a"_s);
    floatPanel(manager, u"b"_s);

    const QByteArray saved = manager.saveLayout();
    ASSERT_FALSE(saved.isEmpty());
    ASSERT_TRUE(manager.loadLayout(saved).ok);
    EXPECT_NE(manager.findWidgetById(u"a"_s), nullptr);
    EXPECT_NE(manager.findWidgetById(u"b"_s), nullptr);
    EXPECT_EQ(manager.containers().size(), 2);

    const QByteArray layout = R"({"version": 1, "windows": [
        {"kind": "floating", "content": {"type": "tabgroup", "children": [
            {"type": "widget", "id": "thrower"},
            {"type": "widget", "id": "kept"}]}}
    ]})";
    ASSERT_TRUE(manager.loadLayout(layout).ok);
    EXPECT_EQ(manager.findWidgetById(u"thrower"_s), nullptr);
    ASSERT_EQ(manager.containers().size(), 1);
    EXPECT_EQ(idsIn(manager, manager.containers().constFirst()), QStringList{u"kept"_s});
}

TEST(LayoutSerializerTests, UnknownAndDuplicateWidgetsAreSkipped)
{
    DockingTests::ensureApp();
    DockingManager manager;
    installFactory(manager);

    const QByteArray layout = R"({"version": 1, "windows": [
        {"kind": "floating", "geometry": {"x": 10, "y": 10, "w": 300, "h": 200},
         "content": {"type": "tabgroup", "children": [
            {"type": "widget", "id": "known"},
            {"type": "widget", "id": "unknown"},
            {"type": "widget", "id": "explodes"},
            {"type": "widget", "id": "known"}]}},
        {"kind": "floating",
         "content": {"type": "tabgroup", "children": [{"type": "widget", "id": "unknown"}]}}
    ]})";

    ASSERT_TRUE(manager.loadLayout(layout).ok);

    ASSERT_EQ(manager.containers().size(), 1);
    EXPECT_EQ(idsIn(manager, manager.containers().constFirst()), QStringList{u"known"_s});
    EXPECT_EQ(manager.findWidgetById(u"unknown"_s), nullptr);
}

TEST(LayoutSerializerTests, BrokenWindowsAreSkipped)
{
    DockingTests::ensureApp();
    DockingManager manager;
    installFactory(manager);

    const QByteArray layout = R"({"version": 1, "windows": [
        {"kind": "sideways"},
        {"kind": "floating", "geometry": {"x": "left"}},
        {"kind": "floating", "content": {"type": "splitter", "orientation": "horizontal",
                                         "children": [{"type": "widget", "id": "direct"}]}},
        "not a window",
        {"kind": "floating", "content": {"type": "tabgroup", "children": [{"type": "widget", "id": "x"}]}}
    ]})";

    ASSERT_TRUE(manager.loadLayout(layout).ok);
    ASSERT_EQ(manager.containers().size(), 1);
    EXPECT_NE(manager.findWidgetById(u"x"_s), nullptr);
    EXPECT_EQ(manager.findWidgetById(u"direct"_s), nullptr);
}

TEST(LayoutSerializerTests, MalformedDocumentLeavesLayoutUntouched)
{
    DockingTests::ensureApp();
    DockingManager manager;
    installFactory(manager);

    DockContainer* window = floatPanel(manager, u"a"_s);
    DockPanel* a = manager.findWidgetById(u"a"_s);

    EXPECT_FALSE(manager.loadLayout("{ not json").ok);
    EXPECT_FALSE(manager.loadLayout(R"({"windows": []})").ok);
    EXPECT_FALSE(manager.loadLayout(R"({"version": 99, "windows": []})").ok);
    EXPECT_FALSE(manager.loadLayout(R"({"version": 1, "windows": {}})").ok);

    EXPECT_EQ(manager.containers(), QList<DockContainer*>{window});
    EXPECT_EQ(manager.findWidgetById(u"a"_s), a);
}

TEST(LayoutSerializerTests, PersistentRootsAreReused)
{
    DockingTests::ensureApp();
    DockingManager manager;
    installFactory(manager);

    DockContainer* dockRoot = manager.createFloatingRoot(u"Tools"_s);
    floatPanel(manager, u"a"_s);
    ASSERT_TRUE(manager.moveWidgetToContainer(manager.findWidgetById(u"a"_s), dockRoot).ok);

    ASSERT_TRUE(manager.loadLayout(manager.saveLayout()).ok);

    EXPECT_EQ(manager.containers(), QList<DockContainer*>{dockRoot});
    EXPECT_EQ(manager.containerOf(manager.findWidgetById(u"a"_s)), dockRoot);
    EXPECT_EQ(dockRoot->windowTitle(), u"Tools"_s);
}

TEST(LayoutSerializerTests, MaximizedStateSurvivesRoundTrip)
{
    DockingTests::ensureApp();
    DockingManager manager;
    installFactory(manager);

    DockContainer* window = floatPanel(manager, u"a"_s);
    const QRect normal(30, 40, 320, 240);
    window->setMaximizedState(true, normal);

    ASSERT_TRUE(manager.loadLayout(manager.saveLayout()).ok);

    DockContainer* restored = manager.containerOf(manager.findWidgetById(u"a"_s));
    ASSERT_NE(restored, nullptr);
    EXPECT_TRUE(restored->isMaximizedState());
    EXPECT_EQ(restored->storedNormalGeometry(), normal);
}

TEST(LayoutSerializerTests, MainAreaRecordNeedsAMainArea)
{
    DockingTests::ensureApp();

    QByteArray saved;
    {
        DockingManager manager;
        installFactory(manager);
        MainDockWindow host(&manager);
        floatPanel(manager, u"m"_s);
        ASSERT_TRUE(manager.moveWidgetToContainer(manager.findWidgetById(u"m"_s), host.dockArea()).ok);
        floatPanel(manager, u"f"_s);
        saved = manager.saveLayout();
    }
    DockingTests::flushEvents();

    DockingManager bare;
    installFactory(bare);
    ASSERT_TRUE(bare.loadLayout(saved).ok);

    EXPECT_EQ(bare.containers().size(), 1);
    EXPECT_EQ(bare.findWidgetById(u"m"_s), nullptr);
    EXPECT_NE(bare.findWidgetById(u"f"_s), nullptr);
}

TEST(LayoutSerializerTests, FileRoundTrip)
{
    DockingTests::ensureApp();

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(u"layouts/session.json"_s);

    DockingManager manager;
    installFactory(manager);
    floatPanel(manager, u"a"_s);
    floatPanel(manager, u"b"_s);
    ASSERT_TRUE(manager.saveLayoutToFile(path).ok);

    ASSERT_TRUE(manager.closeWidget(manager.findWidgetById(u"a"_s)).ok);
    ASSERT_EQ(manager.containers().size(), 1);

    ASSERT_TRUE(manager.loadLayoutFromFile(path).ok);
    EXPECT_EQ(manager.containers().size(), 2);
    EXPECT_NE(manager.findWidgetById(u"a"_s), nullptr);

    EXPECT_FALSE(manager.loadLayoutFromFile(QDir(dir.path()).filePath(u"missing.json"_s)).ok);
    EXPECT_EQ(manager.containers().size(), 2);
}
