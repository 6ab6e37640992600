// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QHashFunctions>
#include <QtCore/QString>
#include <QtCore/QUuid>

#include <algorithm>
#include <compare>
#include <optional>

namespace Utils {

namespace Internal {

inline int compareUuidBytes(const QUuid& a, const QUuid& b)
{
    const QByteArray ab = a.toRfc4122();
    const QByteArray bb = b.toRfc4122();
    const auto n = std::min(ab.size(), bb.size());
    for (qsizetype i = 0; i < n; ++i) {
        const auto ac = static_cast<unsigned char>(ab[i]);
        const auto bc = static_cast<unsigned char>(bb[i]);
        if (ac != bc)
            return ac < bc ? -1 : 1;
    }
    if (ab.size() == bb.size())
        return 0;
    return ab.size() < bb.size() ? -1 : 1;
}

inline std::optional<QUuid> parseUuidLenient(QString s)
{
    s = s.trimmed();
    if (s.isEmpty())
        return std::nullopt;

    QUuid u = QUuid::fromString(s);
    if (!u.isNull())
        return u;

    if (!s.startsWith(u'{'))
        s.prepend(u'{');
    if (!s.endsWith(u'}'))
        s.append(u'}');

    u = QUuid::fromString(s);
    if (u.isNull())
        return std::nullopt;
    return u;
}

} // namespace Internal

// Typed uuid; distinct tags give ids that cannot be mixed up.
template <typename Tag>
class StrongId final {
public:
    using tag_type = Tag;

    constexpr StrongId() noexcept = default;
    explicit StrongId(const QUuid& uuid) noexcept : m_uuid(uuid) {}

    static StrongId create() { return StrongId(QUuid::createUuid()); }
    static constexpr StrongId null() noexcept { return StrongId(); }

    bool isNull() const noexcept { return m_uuid.isNull(); }
    const QUuid& uuid() const noexcept { return m_uuid; }

    QString toString(QUuid::StringFormat fmt = QUuid::WithoutBraces) const { return m_uuid.toString(fmt); }

    static std::optional<StrongId> fromString(const QString& s)
    {
        const auto parsed = Internal::parseUuidLenient(s);
        if (!parsed)
            return std::nullopt;
        return StrongId(*parsed);
    }

    friend bool operator==(const StrongId& a, const StrongId& b) noexcept { return a.m_uuid == b.m_uuid; }

    friend std::strong_ordering operator<=>(const StrongId& a, const StrongId& b) noexcept
    {
        const int c = Internal::compareUuidBytes(a.m_uuid, b.m_uuid);
        if (c < 0)
            return std::strong_ordering::less;
        if (c > 0)
            return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

private:
    QUuid m_uuid{};
};

template <typename Tag>
size_t qHash(const StrongId<Tag>& id, size_t seed = 0) noexcept
{
    return qHash(id.uuid(), seed);
}

} // namespace Utils
