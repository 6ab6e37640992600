// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/services/DockingStateMachine.hpp"

namespace Docking {

bool DockingStateMachine::tryEnter(DockingState state)
{
    if (state == DockingState::Idle || state == DockingState::Rendering)
        return false;
    if (m_state != DockingState::Idle) {
        qCDebug(dockinglog).noquote() << "Refusing" << dockingStateToString(state)
                                      << "while" << dockingStateToString(m_state);
        return false;
    }
    setState(state);
    return true;
}

bool DockingStateMachine::leave(DockingState state)
{
    if (m_state != state || state == DockingState::Idle)
        return false;
    setState(DockingState::Idle);
    return true;
}

void DockingStateMachine::reset()
{
    setState(DockingState::Idle);
}

void DockingStateMachine::setState(DockingState state)
{
    if (m_state == state)
        return;
    const DockingState from = m_state;
    m_state = state;
    qCDebug(dockinglog).noquote() << "State" << dockingStateToString(from) << "->" << dockingStateToString(state);
    if (m_observer)
        m_observer(from, state);
}

} // namespace Docking
