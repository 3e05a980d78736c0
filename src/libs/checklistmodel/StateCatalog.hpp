// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"
#include "checklistmodel/StateDefinition.hpp"

#include <QtCore/QVector>

namespace ChecklistModel {

class CHECKLISTMODEL_EXPORT StateCatalog final {
public:
    StateCatalog() = default;
    explicit StateCatalog(QVector<StateDefinition> states, int defaultStatusNumber = 0);

    static StateCatalog defaultCatalog();

    const QVector<StateDefinition>& states() const noexcept { return m_states; }
    int defaultStatusNumber() const noexcept { return m_defaultStatusNumber; }
    void setDefaultStatusNumber(int number) noexcept { m_defaultStatusNumber = number; }

    bool isEmpty() const noexcept { return m_states.isEmpty(); }
    int size() const noexcept { return m_states.size(); }

    const StateDefinition* byNumber(int number) const noexcept;
    bool contains(int number) const noexcept { return byNumber(number) != nullptr; }

    // Definition used for painting. Unknown numbers render as status 0.
    StateDefinition resolve(int number) const;

    // inCycle states with number >= 0, ascending. Falls back to every
    // non-bullet state when none is marked for the cycle.
    QVector<StateDefinition> cycleableStates() const;
    QVector<StateDefinition> checkboxStates() const;

    // Smallest number >= 0 not yet taken.
    int nextFreeNumber() const;

    friend bool operator==(const StateCatalog& a, const StateCatalog& b)
    {
        return a.m_defaultStatusNumber == b.m_defaultStatusNumber && a.m_states == b.m_states;
    }
    friend bool operator!=(const StateCatalog& a, const StateCatalog& b) { return !(a == b); }

private:
    QVector<StateDefinition> m_states;
    int m_defaultStatusNumber = 0;
};

} // namespace ChecklistModel
