// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <functional>
#include <optional>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Docking {

// Content types that can be created by key, both by the host and when a saved
// layout is loaded. Owned by one DockingManager.
class DOCKING_EXPORT WidgetRegistry final
{
public:
    using Factory = std::function<QWidget*()>;

    struct Registration final {
        QString key;
        QString defaultTitle;
        Factory factory;
    };

    bool registerFactory(const QString& key, Factory factory, const QString& defaultTitle, QString* errorOut = nullptr);

    template <typename T>
    bool registerType(const QString& key, const QString& defaultTitle, QString* errorOut = nullptr)
    {
        return registerFactory(key, [] { return static_cast<QWidget*>(new T()); }, defaultTitle, errorOut);
    }

    bool unregister(const QString& key);

    bool isRegistered(const QString& key) const;
    std::optional<Registration> registration(const QString& key) const;
    QStringList keys() const { return m_order; }

    // Runs the factory for key. Exceptions from the factory are reported as
    // errors, never propagated.
    QWidget* create(const QString& key, QString* errorOut = nullptr) const;

private:
    QHash<QString, Registration> m_entries;
    QStringList m_order;
};

} // namespace Docking
