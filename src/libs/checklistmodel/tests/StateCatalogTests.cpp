// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "checklistmodel/StateCatalog.hpp"

using namespace ChecklistModel;

namespace {

StateDefinition state(int number, bool inCycle = true, const char* symbol = "square")
{
    StateDefinition s;
    s.number = number;
    s.label = QStringLiteral("S%1").arg(number);
    s.color = QStringLiteral("#123456");
    s.symbol = QString::fromLatin1(symbol);
    s.inCycle = inCycle;
    return s;
}

QVector<int> numbers(const QVector<StateDefinition>& states)
{
    QVector<int> out;
    for (const auto& s : states)
        out.push_back(s.number);
    return out;
}

} // namespace

TEST(StateCatalogTests, DefaultCatalogHasSixEntries)
{
    const StateCatalog catalog = StateCatalog::defaultCatalog();

    ASSERT_EQ(catalog.size(), 6);
    EXPECT_EQ(catalog.defaultStatusNumber(), 0);

    const StateDefinition* bullet = catalog.byNumber(kBulletStatus);
    ASSERT_NE(bullet, nullptr);
    EXPECT_EQ(bullet->symbol, QStringLiteral("bullet"));
    EXPECT_FALSE(bullet->inCycle);

    EXPECT_EQ(catalog.byNumber(1)->symbol, QStringLiteral("check"));
    EXPECT_EQ(catalog.byNumber(2)->symbol, QStringLiteral("clock"));
    EXPECT_EQ(catalog.byNumber(4)->label, QStringLiteral("Cancelled"));
    EXPECT_EQ(catalog.byNumber(0)->color, QStringLiteral("#F44336"));
    EXPECT_EQ(numbers(catalog.cycleableStates()), (QVector<int>{0, 1, 2, 3, 4}));
}

TEST(StateCatalogTests, CycleableStatesAreSortedAndSkipBullet)
{
    const StateCatalog catalog({state(5), state(kBulletStatus, false), state(2, false), state(0)});

    EXPECT_EQ(numbers(catalog.cycleableStates()), (QVector<int>{0, 5}));
    EXPECT_EQ(numbers(catalog.checkboxStates()), (QVector<int>{0, 2, 5}));
}

TEST(StateCatalogTests, CycleFallsBackToAllCheckboxStates)
{
    const StateCatalog catalog({state(3, false), state(1, false), state(kBulletStatus, true)});

    EXPECT_EQ(numbers(catalog.cycleableStates()), (QVector<int>{1, 3}));
}

TEST(StateCatalogTests, ResolveFallsBackToStatusZero)
{
    const StateCatalog catalog = StateCatalog::defaultCatalog();

    EXPECT_EQ(catalog.resolve(2).number, 2);
    EXPECT_EQ(catalog.resolve(42).number, 0);
    EXPECT_EQ(catalog.resolve(42).symbol, QStringLiteral("empty"));

    const StateCatalog sparse({state(7), state(3)});
    EXPECT_EQ(sparse.resolve(99).number, 3);

    const StateCatalog empty;
    EXPECT_EQ(empty.resolve(1).symbol, QStringLiteral("square"));
}

TEST(StateCatalogTests, NextFreeNumberFillsGaps)
{
    EXPECT_EQ(StateCatalog::defaultCatalog().nextFreeNumber(), 5);
    EXPECT_EQ(StateCatalog({state(0), state(2)}).nextFreeNumber(), 1);
    EXPECT_EQ(StateCatalog().nextFreeNumber(), 0);
}

TEST(StateCatalogTests, SymbolPaletteIsFixed)
{
    const QStringList palette = Symbols::palette();
    EXPECT_EQ(palette.size(), 10);
    EXPECT_EQ(palette.front(), QStringLiteral("bullet"));
    EXPECT_TRUE(Symbols::isKnown(QStringLiteral("question")));
    EXPECT_FALSE(Symbols::isKnown(QStringLiteral("heart")));
}
