// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QJsonObject>

namespace Docking {

// Optional interface for dockable content that persists its own state in
// saved layouts. Checked before any externally registered state handlers.
class DOCKING_EXPORT IDockStateful
{
public:
    virtual ~IDockStateful() = default;

    virtual QJsonObject captureDockState() const = 0;
    virtual void restoreDockState(const QJsonObject& state) = 0;
};

} // namespace Docking
