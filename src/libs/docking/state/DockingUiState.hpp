// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <utils/EnvironmentQtPolicy.hpp>
#include <utils/Result.hpp>

#include <QtCore/QByteArray>

namespace Docking {

class DockingManager;

// Session persistence for a docking host: the main window geometry in the
// settings tier and the last layout as a state document.
class DOCKING_EXPORT DockingUiState final
{
public:
    DockingUiState();
    explicit DockingUiState(Utils::Environment environment);

    QByteArray mainWindowGeometry() const;
    void setMainWindowGeometry(const QByteArray& geometry);

    bool hasSavedLayout() const;
    Utils::Result saveLayout(DockingManager& manager) const;
    Utils::Result restoreLayout(DockingManager& manager) const;
    void clearSavedLayout() const;

    const Utils::Environment& environment() const { return m_env; }

    static Utils::Environment makeEnvironment();

private:
    Utils::Environment m_env;
};

} // namespace Docking
