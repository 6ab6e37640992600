// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <cstddef>
#include <utility>

namespace Utils {

struct EnvironmentConfig final {
    QString organizationName;
    QString applicationName;

    // Replaces the platform config location; tests point it at a temp dir.
    QString configRootOverride;

    std::size_t maxStateDocumentBytes = 4u * 1024u * 1024u;   // 4 MiB
};

struct EnvironmentPaths final {
    QString configDir;  // resolved absolute
    QString stateDir;   // configDir/state
};

struct DocumentLoadResult final {
    enum class Status : unsigned char {
        Ok,
        NotFound,
        Corrupt
    };

    Status status = Status::NotFound;
    QJsonObject object;
    bool fromBackup = false;
    QString error;
};

struct DocumentSaveResult final {
    bool ok = false;
    QString error;
};

// Application settings plus named JSON state documents. Every save keeps the
// previous document as a backup, and loading falls back to it when the
// primary copy is unreadable. The policy owns the storage; tests can swap it.
template <typename PersistencePolicy>
class BasicEnvironment final {
public:
    using Policy = PersistencePolicy;
    using SettingsHandle = typename Policy::SettingsHandle;

    explicit BasicEnvironment(EnvironmentConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
        , m_paths(m_policy.resolvePaths(m_config))
    {}

    const EnvironmentConfig& config() const noexcept { return m_config; }
    const EnvironmentPaths& paths() const noexcept { return m_paths; }
    const Policy& policy() const noexcept { return m_policy; }

    // Settings ------------------------------------------------------------

    QVariant setting(QStringView key, const QVariant& def = {}) const
    {
        auto h = m_policy.openSettings(m_paths);
        return m_policy.settingsValue(h, key, def);
    }

    void setSetting(QStringView key, const QVariant& value)
    {
        auto h = m_policy.openSettings(m_paths);
        m_policy.setSettingsValue(h, key, value);
        m_policy.syncSettings(h);
    }

    void removeSetting(QStringView key)
    {
        auto h = m_policy.openSettings(m_paths);
        m_policy.removeSettingsKey(h, key);
        m_policy.syncSettings(h);
    }

    bool hasSetting(QStringView key) const
    {
        auto h = m_policy.openSettings(m_paths);
        return m_policy.settingsContains(h, key);
    }

    // State documents -----------------------------------------------------

    // Names become file names, so path separators are refused.
    static bool isValidStateName(QStringView name)
    {
        const QStringView trimmed = name.trimmed();
        return !trimmed.isEmpty() && trimmed == name && !name.contains(u'/') && !name.contains(u'\\')
               && name != u"." && name != u"..";
    }

    DocumentLoadResult loadState(QStringView name) const
    {
        DocumentLoadResult result;
        if (!isValidStateName(name)) {
            result.status = DocumentLoadResult::Status::Corrupt;
            result.error = QStringLiteral("Invalid state document name: '%1'").arg(name.toString());
            return result;
        }

        QString ensureErr;
        if (!m_policy.ensureStorage(m_paths, &ensureErr)) {
            result.status = DocumentLoadResult::Status::Corrupt;
            result.error = ensureErr.isEmpty() ? QStringLiteral("Failed to ensure storage.") : ensureErr;
            return result;
        }

        DocumentLoadResult primary = readDocument(name, /*fromBackup=*/false);
        if (primary.status == DocumentLoadResult::Status::Ok)
            return primary;

        DocumentLoadResult backup = readDocument(name, /*fromBackup=*/true);
        if (backup.status == DocumentLoadResult::Status::Ok)
            return backup;

        // A backup that exists but is unreadable wins the error report.
        if (backup.status == DocumentLoadResult::Status::Corrupt)
            return backup;
        return primary;
    }

    DocumentSaveResult saveState(QStringView name, const QJsonObject& object) const
    {
        DocumentSaveResult out;
        if (!isValidStateName(name)) {
            out.error = QStringLiteral("Invalid state document name: '%1'").arg(name.toString());
            return out;
        }

        QString ensureErr;
        if (!m_policy.ensureStorage(m_paths, &ensureErr)) {
            out.error = ensureErr.isEmpty() ? QStringLiteral("Failed to ensure storage.") : ensureErr;
            return out;
        }

        const QByteArray bytes = QJsonDocument(object).toJson(QJsonDocument::Compact);
        if (static_cast<std::size_t>(bytes.size()) > m_config.maxStateDocumentBytes) {
            out.error = oversizedMessage();
            return out;
        }

        QString err;
        out.ok = m_policy.writeStateBytesAtomic(m_paths, name, bytes, &err);
        out.error = err;
        return out;
    }

    bool removeState(QStringView name, bool removeBackup = true, QString* error = nullptr) const
    {
        QString err;
        bool ok = false;
        if (!isValidStateName(name))
            err = QStringLiteral("Invalid state document name: '%1'").arg(name.toString());
        else
            ok = m_policy.removeState(m_paths, name, removeBackup, &err);
        if (error)
            *error = err;
        return ok;
    }

private:
    QString oversizedMessage() const
    {
        return QStringLiteral("State document exceeds maxStateDocumentBytes (limit: %1).")
            .arg(m_config.maxStateDocumentBytes);
    }

    // NotFound when the file is absent, Corrupt when it cannot be read or parsed.
    DocumentLoadResult readDocument(QStringView name, bool fromBackup) const
    {
        DocumentLoadResult result;
        result.fromBackup = fromBackup;

        QByteArray bytes;
        QString err;
        if (!m_policy.readStateBytes(m_paths, name, fromBackup, &bytes, &err)) {
            result.status = err.isEmpty() ? DocumentLoadResult::Status::NotFound
                                          : DocumentLoadResult::Status::Corrupt;
            result.error = err;
            return result;
        }

        result.status = DocumentLoadResult::Status::Corrupt;
        if (static_cast<std::size_t>(bytes.size()) > m_config.maxStateDocumentBytes) {
            result.error = oversizedMessage();
            return result;
        }

        QJsonParseError pe{};
        const QJsonDocument doc = QJsonDocument::fromJson(bytes, &pe);
        if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
            result.error = fromBackup ? QStringLiteral("Backup state document is invalid.")
                                      : QStringLiteral("Invalid JSON state document.");
            return result;
        }

        result.status = DocumentLoadResult::Status::Ok;
        result.object = doc.object();
        return result;
    }

    EnvironmentConfig m_config;
    Policy m_policy;
    EnvironmentPaths m_paths;
};

} // namespace Utils
