// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/StateCatalog.hpp"

#include <QtCore/QSet>

#include <algorithm>

namespace ChecklistModel {

namespace Symbols {

QStringList palette()
{
    return {
        kBullet, kEmpty, kCheck, kClock, kMinus, kSquare, kX, kStar, kExclaim, kQuestion,
    };
}

bool isKnown(const QString& symbol)
{
    return palette().contains(symbol);
}

} // namespace Symbols

namespace {

StateDefinition makeState(int number, const char* label, const char* color, QLatin1String symbol,
                          bool inCycle = true)
{
    StateDefinition s;
    s.number = number;
    s.label = QString::fromLatin1(label);
    s.color = QString::fromLatin1(color);
    s.symbol = symbol;
    s.inCycle = inCycle;
    return s;
}

QVector<StateDefinition> sortedNonBullet(const QVector<StateDefinition>& states, bool cycleOnly)
{
    QVector<StateDefinition> out;
    for (const auto& s : states) {
        if (s.number < 0)
            continue;
        if (cycleOnly && !s.inCycle)
            continue;
        out.push_back(s);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const StateDefinition& a, const StateDefinition& b) { return a.number < b.number; });
    return out;
}

} // namespace

StateCatalog::StateCatalog(QVector<StateDefinition> states, int defaultStatusNumber)
    : m_states(std::move(states))
    , m_defaultStatusNumber(defaultStatusNumber)
{
}

StateCatalog StateCatalog::defaultCatalog()
{
    return StateCatalog({
                            makeState(kBulletStatus, "Bullet", "#616161", Symbols::kBullet, false),
                            makeState(0, "To Do", "#F44336", Symbols::kEmpty),
                            makeState(1, "Done", "#4CAF50", Symbols::kCheck),
                            makeState(2, "Waiting", "#9C27B0", Symbols::kClock),
                            makeState(3, "On Hold", "#FF9800", Symbols::kMinus),
                            makeState(4, "Cancelled", "#9E9E9E", Symbols::kX),
                        },
                        0);
}

const StateDefinition* StateCatalog::byNumber(int number) const noexcept
{
    for (const auto& s : m_states) {
        if (s.number == number)
            return &s;
    }
    return nullptr;
}

StateDefinition StateCatalog::resolve(int number) const
{
    if (const StateDefinition* s = byNumber(number))
        return *s;
    if (const StateDefinition* fallback = byNumber(0))
        return *fallback;

    const QVector<StateDefinition> boxes = checkboxStates();
    if (!boxes.isEmpty())
        return boxes.front();

    StateDefinition neutral;
    neutral.number = 0;
    neutral.label = QStringLiteral("Unknown");
    neutral.color = QStringLiteral("#888888");
    neutral.symbol = Symbols::kSquare;
    return neutral;
}

QVector<StateDefinition> StateCatalog::cycleableStates() const
{
    QVector<StateDefinition> cycle = sortedNonBullet(m_states, true);
    if (cycle.isEmpty())
        cycle = sortedNonBullet(m_states, false);
    return cycle;
}

QVector<StateDefinition> StateCatalog::checkboxStates() const
{
    return sortedNonBullet(m_states, false);
}

int StateCatalog::nextFreeNumber() const
{
    QSet<int> taken;
    for (const auto& s : m_states)
        taken.insert(s.number);

    int candidate = 0;
    while (taken.contains(candidate))
        ++candidate;
    return candidate;
}

} // namespace ChecklistModel
