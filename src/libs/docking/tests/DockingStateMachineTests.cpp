// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "docking/services/DockingStateMachine.hpp"

#include <QtCore/QList>
#include <QtCore/QPair>

using namespace Docking;

TEST(DockingStateMachineTests, InteractionsStartFromIdleOnly)
{
    DockingStateMachine machine;
    EXPECT_TRUE(machine.isIdle());

    EXPECT_TRUE(machine.tryEnter(DockingState::DraggingWindow));
    EXPECT_FALSE(machine.tryEnter(DockingState::Resizing));
    EXPECT_FALSE(machine.tryEnter(DockingState::DraggingTab));
    EXPECT_EQ(machine.state(), DockingState::DraggingWindow);

    EXPECT_FALSE(machine.leave(DockingState::Resizing));
    EXPECT_TRUE(machine.leave(DockingState::DraggingWindow));
    EXPECT_TRUE(machine.isIdle());
    EXPECT_TRUE(machine.tryEnter(DockingState::Resizing));
}

TEST(DockingStateMachineTests, IdleAndRenderingCannotBeEnteredDirectly)
{
    DockingStateMachine machine;
    EXPECT_FALSE(machine.tryEnter(DockingState::Idle));
    EXPECT_FALSE(machine.tryEnter(DockingState::Rendering));
    EXPECT_FALSE(machine.leave(DockingState::Idle));
}

TEST(DockingStateMachineTests, RenderingGuardRestoresPreviousState)
{
    DockingStateMachine machine;
    ASSERT_TRUE(machine.tryEnter(DockingState::DraggingTab));

    {
        auto rendering = machine.enterRendering();
        EXPECT_TRUE(machine.isRendering());
        EXPECT_FALSE(machine.tryEnter(DockingState::Resizing));
    }
    EXPECT_EQ(machine.state(), DockingState::DraggingTab);

    {
        auto outer = machine.enterRendering();
        {
            auto inner = machine.enterRendering();
            EXPECT_TRUE(machine.isRendering());
        }
        EXPECT_TRUE(machine.isRendering());
    }
    EXPECT_EQ(machine.state(), DockingState::DraggingTab);
}

TEST(DockingStateMachineTests, ObserverSeesEveryTransition)
{
    DockingStateMachine machine;
    QList<QPair<DockingState, DockingState>> seen;
    machine.setTransitionObserver([&seen](DockingState from, DockingState to) { seen.push_back({from, to}); });

    ASSERT_TRUE(machine.tryEnter(DockingState::Resizing));
    machine.reset();
    machine.reset();

    ASSERT_EQ(seen.size(), 2);
    EXPECT_EQ(seen.at(0), qMakePair(DockingState::Idle, DockingState::Resizing));
    EXPECT_EQ(seen.at(1), qMakePair(DockingState::Resizing, DockingState::Idle));
}
