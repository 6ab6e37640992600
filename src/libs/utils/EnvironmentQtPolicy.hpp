// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Environment.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QSettings>

#include <memory>

namespace Utils {

// Settings in <config>/settings.ini, state documents in <config>/state/<name>.json
// with the previous copy kept as <name>.json.bak.
class UTILS_EXPORT QtEnvironmentPersistencePolicy final {
public:
	struct SettingsHandle final {
		std::unique_ptr<QSettings> settings;
	};

	EnvironmentPaths resolvePaths(const EnvironmentConfig& cfg) const;

	SettingsHandle openSettings(const EnvironmentPaths& paths) const;
	QVariant settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const;
	void setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const;
	void removeSettingsKey(SettingsHandle& h, QStringView key) const;
	bool settingsContains(const SettingsHandle& h, QStringView key) const;
	void syncSettings(SettingsHandle& h) const;

	bool ensureStorage(const EnvironmentPaths& paths, QString* error) const;

	// Returns false with an empty error when the document does not exist.
	bool readStateBytes(const EnvironmentPaths& paths, QStringView name, bool useBackup,
						QByteArray* out, QString* error) const;
	bool writeStateBytesAtomic(const EnvironmentPaths& paths, QStringView name,
							   const QByteArray& bytes, QString* error) const;
	bool removeState(const EnvironmentPaths& paths, QStringView name, bool removeBackup, QString* error) const;

private:
	static QString stateFilePath(const EnvironmentPaths& paths, QStringView name, bool backup);
};

using Environment = BasicEnvironment<QtEnvironmentPersistencePolicy>;

} // namespace Utils
