// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/WidgetRegistry.hpp"

#include <QtWidgets/QWidget>

#include <exception>

namespace Docking {

bool WidgetRegistry::registerFactory(const QString& key, Factory factory, const QString& defaultTitle, QString* errorOut)
{
    auto fail = [&](const QString& message) {
        if (errorOut)
            *errorOut = message;
        return false;
    };

    const QString cleaned = key.trimmed();
    if (cleaned.isEmpty())
        return fail(QStringLiteral("Widget key is empty."));
    if (!factory)
        return fail(QStringLiteral("Widget factory for '%1' is empty.").arg(cleaned));
    if (m_entries.contains(cleaned))
        return fail(QStringLiteral("Widget key '%1' is already registered.").arg(cleaned));

    m_entries.insert(cleaned, Registration{cleaned, defaultTitle, std::move(factory)});
    m_order.push_back(cleaned);
    if (errorOut)
        errorOut->clear();
    return true;
}

bool WidgetRegistry::unregister(const QString& key)
{
    if (!m_entries.remove(key.trimmed()))
        return false;
    m_order.removeAll(key.trimmed());
    return true;
}

bool WidgetRegistry::isRegistered(const QString& key) const
{
    return m_entries.contains(key.trimmed());
}

std::optional<WidgetRegistry::Registration> WidgetRegistry::registration(const QString& key) const
{
    const auto it = m_entries.constFind(key.trimmed());
    if (it == m_entries.cend())
        return std::nullopt;
    return *it;
}

QWidget* WidgetRegistry::create(const QString& key, QString* errorOut) const
{
    const auto it = m_entries.constFind(key.trimmed());
    if (it == m_entries.cend()) {
        if (errorOut)
            *errorOut = QStringLiteral("No widget registered for key '%1'.").arg(key);
        return nullptr;
    }

    QWidget* widget = nullptr;
    try {
        widget = it->factory();
    } catch (const std::exception& e) {
        if (errorOut)
            *errorOut = QStringLiteral("Factory for '%1' threw: %2").arg(key, QString::fromUtf8(e.what()));
        return nullptr;
    } catch (...) {
        if (errorOut)
            *errorOut = QStringLiteral("Factory for '%1' threw an unknown exception.").arg(key);
        return nullptr;
    }

    if (!widget && errorOut)
        *errorOut = QStringLiteral("Factory for '%1' returned no widget.").arg(key);
    else if (errorOut)
        errorOut->clear();
    return widget;
}

} // namespace Docking
