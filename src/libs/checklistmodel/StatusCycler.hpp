// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"
#include "checklistmodel/ItemId.hpp"
#include "checklistmodel/StateCatalog.hpp"

#include <QtCore/QHash>

namespace ChecklistModel {

// Per-item gesture state for the status indicator. Times are milliseconds
// on a monotonic clock supplied by the caller.
class CHECKLISTMODEL_EXPORT StatusCycler final {
public:
    static constexpr qint64 kRapidClickWindowMs = 1000;
    static constexpr qint64 kLongPressMs = 500;

    enum class Gesture : quint8 {
        Ignored,
        SmartClick,
        CycleStep,
        LongPress
    };

    struct Outcome final {
        Gesture gesture = Gesture::Ignored;
        int statusNumber = 0;
        bool changed = false;
    };

    Outcome click(const ItemId& id, int current, const StateCatalog& catalog, qint64 nowMs);

    void press(const ItemId& id, qint64 nowMs);
    // Resolves a press: held for kLongPressMs or longer is a long press,
    // anything shorter is a click. A release without a press is a click.
    Outcome release(const ItemId& id, int current, const StateCatalog& catalog, qint64 nowMs);
    void cancelPress(const ItemId& id);

    void forget(const ItemId& id);
    void reset();

    static int smartTarget(int current, const StateCatalog& catalog);
    static int nextInCycle(int current, const StateCatalog& catalog);
    static int toggleBullet(int current) noexcept;

private:
    QHash<ItemId, qint64> m_lastClickMs;
    QHash<ItemId, qint64> m_pressStartedMs;
};

} // namespace ChecklistModel
