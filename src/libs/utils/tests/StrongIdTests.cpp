// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/StrongId.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>

#include <algorithm>

namespace {

using namespace Qt::StringLiterals;

struct PaneTag final {};
using PaneId = Utils::StrongId<PaneTag>;

} // namespace

TEST(StrongIdTests, DefaultIsNullAndCreatedIsUnique)
{
    const PaneId empty;
    EXPECT_TRUE(empty.isNull());
    EXPECT_EQ(empty, PaneId::null());

    const PaneId a = PaneId::create();
    const PaneId b = PaneId::create();
    EXPECT_FALSE(a.isNull());
    EXPECT_NE(a, b);
    EXPECT_EQ(a, a);
}

TEST(StrongIdTests, ParsesWithOrWithoutBraces)
{
    const PaneId id = PaneId::create();
    const QString plain = id.toString();

    const auto parsed = PaneId::fromString(plain);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);

    const auto braced = PaneId::fromString(u"  {%1} "_s.arg(plain));
    ASSERT_TRUE(braced.has_value());
    EXPECT_EQ(*braced, id);
}

TEST(StrongIdTests, RejectsGarbageAndEmptyText)
{
    EXPECT_FALSE(PaneId::fromString(QString()).has_value());
    EXPECT_FALSE(PaneId::fromString(u"   "_s).has_value());
    EXPECT_FALSE(PaneId::fromString(u"not-a-uuid"_s).has_value());
}

TEST(StrongIdTests, OrderingIsStrictAndStable)
{
    QList<PaneId> ids;
    for (int i = 0; i < 16; ++i)
        ids.push_back(PaneId::create());

    std::sort(ids.begin(), ids.end());
    for (qsizetype i = 1; i < ids.size(); ++i)
        EXPECT_TRUE(ids.at(i - 1) < ids.at(i));

    const PaneId x = ids.first();
    EXPECT_TRUE((x <=> x) == 0);
}

TEST(StrongIdTests, UsableAsQHashKey)
{
    QHash<PaneId, QString> titles;
    const PaneId a = PaneId::create();
    const PaneId b = PaneId::create();

    titles.insert(a, u"Left"_s);
    titles.insert(b, u"Right"_s);
    EXPECT_EQ(titles.value(a), u"Left"_s);
    EXPECT_EQ(titles.value(b), u"Right"_s);
    EXPECT_FALSE(titles.contains(PaneId::create()));
}
