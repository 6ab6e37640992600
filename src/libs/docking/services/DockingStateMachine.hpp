// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"

#include <utils/ScopeGuard.hpp>

#include <functional>

namespace Docking {

// Single active interaction. Drags and resizes start from Idle only; Rendering
// may nest over anything and restores the previous state when its guard ends.
class DOCKING_EXPORT DockingStateMachine final
{
public:
    using TransitionObserver = std::function<void(DockingState from, DockingState to)>;

    DockingState state() const noexcept { return m_state; }
    bool isIdle() const noexcept { return m_state == DockingState::Idle; }
    bool isRendering() const noexcept { return m_state == DockingState::Rendering; }

    bool tryEnter(DockingState state);
    bool leave(DockingState state);
    void reset();

    [[nodiscard]] auto enterRendering()
    {
        const DockingState previous = m_state;
        setState(DockingState::Rendering);
        return Utils::makeScopeGuard([this, previous] { setState(previous); });
    }

    void setTransitionObserver(TransitionObserver observer) { m_observer = std::move(observer); }

private:
    void setState(DockingState state);

    DockingState m_state = DockingState::Idle;
    TransitionObserver m_observer;
};

} // namespace Docking
