// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/EnvironmentQtPolicy.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>
#include <QtCore/QStandardPaths>

namespace Utils {

namespace {

bool ensureDir(const QString& dir, QString* error)
{
    if (dir.isEmpty()) {
        if (error) *error = QStringLiteral("Storage directory is empty.");
        return false;
    }
    if (QDir(dir).exists() || QDir().mkpath(dir))
        return true;
    if (error) *error = QStringLiteral("Failed to create directory: %1").arg(dir);
    return false;
}

} // namespace

EnvironmentPaths QtEnvironmentPersistencePolicy::resolvePaths(const EnvironmentConfig& cfg) const
{
    const QString root = !cfg.configRootOverride.isEmpty()
                             ? cfg.configRootOverride
                             : QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    const QString app = cfg.applicationName.isEmpty() ? QStringLiteral("Docksmith") : cfg.applicationName;

    EnvironmentPaths out;
    out.configDir = QDir(QDir(root).filePath(app)).absolutePath();
    out.stateDir = QDir(out.configDir).filePath(QStringLiteral("state"));
    return out;
}

QtEnvironmentPersistencePolicy::SettingsHandle
QtEnvironmentPersistencePolicy::openSettings(const EnvironmentPaths& paths) const
{
    SettingsHandle h;
    h.settings = std::make_unique<QSettings>(QDir(paths.configDir).filePath(QStringLiteral("settings.ini")),
                                             QSettings::IniFormat);
    h.settings->setFallbacksEnabled(false);
    return h;
}

QVariant QtEnvironmentPersistencePolicy::settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const
{
    return h.settings ? h.settings->value(key.toString(), def) : def;
}

void QtEnvironmentPersistencePolicy::setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const
{
    if (h.settings)
        h.settings->setValue(key.toString(), value);
}

void QtEnvironmentPersistencePolicy::removeSettingsKey(SettingsHandle& h, QStringView key) const
{
    if (h.settings)
        h.settings->remove(key.toString());
}

bool QtEnvironmentPersistencePolicy::settingsContains(const SettingsHandle& h, QStringView key) const
{
    return h.settings && h.settings->contains(key.toString());
}

void QtEnvironmentPersistencePolicy::syncSettings(SettingsHandle& h) const
{
    if (h.settings)
        h.settings->sync();
}

bool QtEnvironmentPersistencePolicy::ensureStorage(const EnvironmentPaths& paths, QString* error) const
{
    return ensureDir(paths.configDir, error) && ensureDir(paths.stateDir, error);
}

QString QtEnvironmentPersistencePolicy::stateFilePath(const EnvironmentPaths& paths, QStringView name, bool backup)
{
    const QString file = backup ? QStringLiteral("%1.json.bak").arg(name.toString())
                                : QStringLiteral("%1.json").arg(name.toString());
    return QDir(paths.stateDir).filePath(file);
}

bool QtEnvironmentPersistencePolicy::readStateBytes(const EnvironmentPaths& paths, QStringView name, bool useBackup,
                                                    QByteArray* out, QString* error) const
{
    if (out) out->clear();
    if (error) error->clear();

    const QString path = stateFilePath(paths, name, useBackup);
    QFile f(path);
    if (!f.exists())
        return false;
    if (!f.open(QIODevice::ReadOnly)) {
        if (error) *error = QStringLiteral("Failed to open state file: %1").arg(path);
        return false;
    }
    if (out) *out = f.readAll();
    return true;
}

bool QtEnvironmentPersistencePolicy::writeStateBytesAtomic(const EnvironmentPaths& paths, QStringView name,
                                                           const QByteArray& bytes, QString* error) const
{
    const QString primary = stateFilePath(paths, name, /*backup=*/false);
    const QString backup = stateFilePath(paths, name, /*backup=*/true);

    if (!ensureDir(QFileInfo(primary).absolutePath(), error))
        return false;

    // The previous document becomes the backup that loadState falls back to.
    if (QFile::exists(primary)) {
        if (QFile::exists(backup) && !QFile::remove(backup)) {
            if (error) *error = QStringLiteral("Failed to replace backup state file: %1").arg(backup);
            return false;
        }
        if (!QFile::copy(primary, backup)) {
            if (error) *error = QStringLiteral("Failed to back up state file: %1").arg(primary);
            return false;
        }
    }

    QSaveFile sf(primary);
    sf.setDirectWriteFallback(true);
    if (!sf.open(QIODevice::WriteOnly)) {
        if (error) *error = QStringLiteral("Failed to open state file for write: %1").arg(primary);
        return false;
    }
    if (sf.write(bytes) != bytes.size()) {
        sf.cancelWriting();
        if (error) *error = QStringLiteral("Failed to write complete state document: %1").arg(primary);
        return false;
    }
    if (!sf.commit()) {
        if (error) *error = QStringLiteral("Failed to commit state document: %1").arg(primary);
        return false;
    }

    if (error) error->clear();
    return true;
}

bool QtEnvironmentPersistencePolicy::removeState(const EnvironmentPaths& paths, QStringView name,
                                                 bool removeBackup, QString* error) const
{
    const QString primary = stateFilePath(paths, name, /*backup=*/false);
    const QString backup = stateFilePath(paths, name, /*backup=*/true);

    bool ok = !QFile::exists(primary) || QFile::remove(primary);
    if (removeBackup && QFile::exists(backup))
        ok = QFile::remove(backup) && ok;

    if (error) {
        *error = ok ? QString()
                    : QStringLiteral("Failed to remove one or more state files for '%1'.").arg(name.toString());
    }
    return ok;
}

} // namespace Utils
