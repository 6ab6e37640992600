// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "DockingTestSupport.hpp"

#include "docking/DockingManager.hpp"
#include "docking/state/DockingUiState.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/MainDockWindow.hpp"

#include <utils/EnvironmentQtPolicy.hpp>

#include <QtCore/QTemporaryDir>

using namespace Docking;

namespace {

Utils::Environment makeTestEnvironment(const QString& root)
{
    Utils::EnvironmentConfig cfg;
    cfg.organizationName = QStringLiteral("Docksmith");
    cfg.applicationName = QStringLiteral("Docksmith");
    cfg.configRootOverride = root;
    return Utils::Environment(cfg);
}

void installFactory(DockingManager& manager)
{
    manager.setWidgetFactory([](const QString& id) { return DockingTests::makeContent(id); });
}

} // namespace

TEST(DockingUiStateTests, PersistsMainWindowGeometry)
{
    DockingTests::ensureApp();

    QTemporaryDir stateDir;
    ASSERT_TRUE(stateDir.isValid());

    DockingUiState state(makeTestEnvironment(stateDir.path()));
    EXPECT_TRUE(state.mainWindowGeometry().isEmpty());

    state.setMainWindowGeometry(QByteArray("geometry-bytes"));
    state.setMainWindowGeometry(QByteArray());

    DockingUiState restored(makeTestEnvironment(stateDir.path()));
    EXPECT_EQ(restored.mainWindowGeometry(), QByteArray("geometry-bytes"));
}

TEST(DockingUiStateTests, RestoreWithoutSavedLayoutFails)
{
    DockingTests::ensureApp();

    QTemporaryDir stateDir;
    ASSERT_TRUE(stateDir.isValid());

    DockingManager manager;
    DockingUiState state(makeTestEnvironment(stateDir.path()));
    EXPECT_FALSE(state.hasSavedLayout());

    const Utils::Result restored = state.restoreLayout(manager);
    ASSERT_FALSE(restored.ok);
    EXPECT_EQ(restored.errors, QStringList{QStringLiteral("No saved dock layout.")});
}

TEST(DockingUiStateTests, SavedLayoutRestoresIntoAnotherManager)
{
    DockingTests::ensureApp();

    QTemporaryDir stateDir;
    ASSERT_TRUE(stateDir.isValid());

    {
        DockingManager manager;
        manager.createFloatingWindow(DockingTests::makeContent(QStringLiteral("a")),
                                     QStringLiteral("a"), QStringLiteral("A"));
        manager.createFloatingWindow(DockingTests::makeContent(QStringLiteral("b")),
                                     QStringLiteral("b"), QStringLiteral("B"));
        ASSERT_TRUE(manager.dockWidget(manager.findWidgetById(QStringLiteral("b")),
                                       manager.findWidgetById(QStringLiteral("a")),
                                       DockLocation::Center).ok);

        const DockingUiState state(makeTestEnvironment(stateDir.path()));
        ASSERT_TRUE(state.saveLayout(manager).ok);
        EXPECT_TRUE(state.hasSavedLayout());
    }
    DockingTests::flushEvents();

    DockingManager restored;
    installFactory(restored);
    const DockingUiState state(makeTestEnvironment(stateDir.path()));
    ASSERT_TRUE(state.restoreLayout(restored).ok);

    DockPanel* a = restored.findWidgetById(QStringLiteral("a"));
    DockPanel* b = restored.findWidgetById(QStringLiteral("b"));
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(restored.containerOf(a), restored.containerOf(b));
    EXPECT_EQ(restored.containers().size(), 1);
}

TEST(DockingUiStateTests, ClearingForgetsTheLayout)
{
    DockingTests::ensureApp();

    QTemporaryDir stateDir;
    ASSERT_TRUE(stateDir.isValid());

    DockingManager manager;
    const DockingUiState state(makeTestEnvironment(stateDir.path()));
    ASSERT_TRUE(state.saveLayout(manager).ok);
    ASSERT_TRUE(state.hasSavedLayout());

    state.clearSavedLayout();
    EXPECT_FALSE(state.hasSavedLayout());
    EXPECT_FALSE(state.restoreLayout(manager).ok);
}

TEST(DockingUiStateTests, MainWindowSessionRoundTrip)
{
    DockingTests::ensureApp();

    QTemporaryDir stateDir;
    ASSERT_TRUE(stateDir.isValid());

    {
        DockingManager manager;
        MainDockWindow host(&manager);
        EXPECT_FALSE(host.saveSession().ok);

        DockingUiState state(makeTestEnvironment(stateDir.path()));
        host.setUiState(&state);
        manager.createFloatingWindow(DockingTests::makeContent(QStringLiteral("main")),
                                     QStringLiteral("main"), QStringLiteral("Main"));
        ASSERT_TRUE(manager.moveWidgetToContainer(manager.findWidgetById(QStringLiteral("main")),
                                                  host.dockArea()).ok);
        manager.createFloatingWindow(DockingTests::makeContent(QStringLiteral("side")),
                                     QStringLiteral("side"), QStringLiteral("Side"));

        ASSERT_TRUE(host.saveSession().ok);
        EXPECT_FALSE(state.mainWindowGeometry().isEmpty());
        host.setUiState(nullptr);
    }
    DockingTests::flushEvents();

    DockingManager manager;
    installFactory(manager);
    MainDockWindow host(&manager);
    EXPECT_FALSE(host.restoreSession().ok);

    DockingUiState state(makeTestEnvironment(stateDir.path()));
    host.setUiState(&state);
    ASSERT_TRUE(host.restoreSession().ok);

    DockPanel* main = manager.findWidgetById(QStringLiteral("main"));
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(manager.containerOf(main), host.dockArea());
    ASSERT_NE(manager.findWidgetById(QStringLiteral("side")), nullptr);
    EXPECT_EQ(manager.containers().size(), 2);
    host.setUiState(nullptr);
}

TEST(DockingUiStateTests, SessionRestoreWithNothingSavedSucceeds)
{
    DockingTests::ensureApp();

    QTemporaryDir stateDir;
    ASSERT_TRUE(stateDir.isValid());

    DockingManager manager;
    MainDockWindow host(&manager);
    DockingUiState state(makeTestEnvironment(stateDir.path()));
    host.setUiState(&state);

    EXPECT_TRUE(host.restoreSession().ok);
    EXPECT_EQ(manager.containers(), QList<DockContainer*>{host.dockArea()});
    host.setUiState(nullptr);
}
