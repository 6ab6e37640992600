// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/state/DockingUiState.hpp"

#include "docking/DockingManager.hpp"

#include <QtCore/QVariant>

namespace Docking {

namespace {

using namespace Qt::StringLiterals;

const QString kMainWindowGeometryKey = u"docking/mainWindow/geometry"_s;
const QString kLayoutStateName = u"dockLayout"_s;

} // namespace

DockingUiState::DockingUiState()
    : m_env(makeEnvironment())
{
}

DockingUiState::DockingUiState(Utils::Environment environment)
    : m_env(std::move(environment))
{
}

Utils::Environment DockingUiState::makeEnvironment()
{
    Utils::EnvironmentConfig cfg;
    cfg.organizationName = QStringLiteral("Docksmith");
    cfg.applicationName = QStringLiteral("Docksmith");
    return Utils::Environment(cfg);
}

QByteArray DockingUiState::mainWindowGeometry() const
{
    return m_env.setting(kMainWindowGeometryKey, QByteArray()).toByteArray();
}

void DockingUiState::setMainWindowGeometry(const QByteArray& geometry)
{
    if (geometry.isEmpty())
        return;
    m_env.setSetting(kMainWindowGeometryKey, geometry);
}

bool DockingUiState::hasSavedLayout() const
{
    return m_env.loadState(kLayoutStateName).status == Utils::DocumentLoadResult::Status::Ok;
}

Utils::Result DockingUiState::saveLayout(DockingManager& manager) const
{
    const auto saved = m_env.saveState(kLayoutStateName, manager.saveLayoutObject());
    if (!saved.ok)
        return Utils::Result::failure(u"Saving the dock layout failed: %1"_s.arg(saved.error));
    return Utils::Result::success();
}

Utils::Result DockingUiState::restoreLayout(DockingManager& manager) const
{
    const auto loaded = m_env.loadState(kLayoutStateName);
    switch (loaded.status) {
        case Utils::DocumentLoadResult::Status::Ok:
            break;
        case Utils::DocumentLoadResult::Status::NotFound:
            return Utils::Result::failure(u"No saved dock layout."_s);
        case Utils::DocumentLoadResult::Status::Corrupt:
            return Utils::Result::failure(u"Saved dock layout is unreadable: %1"_s.arg(loaded.error));
    }

    if (loaded.fromBackup)
        qCWarning(dockingpersistlog) << "Restoring the dock layout from its backup copy";
    return manager.loadLayoutObject(loaded.object);
}

void DockingUiState::clearSavedLayout() const
{
    QString error;
    if (!m_env.removeState(kLayoutStateName, true, &error) && !error.isEmpty())
        qCWarning(dockingpersistlog).noquote() << error;
}

} // namespace Docking
