// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace ChecklistModel {

// Reserved status for plain bullets. Never part of the click cycle.
inline constexpr int kBulletStatus = -1;

namespace Symbols {

inline constexpr QLatin1String kBullet{"bullet"};
inline constexpr QLatin1String kEmpty{"empty"};
inline constexpr QLatin1String kCheck{"check"};
inline constexpr QLatin1String kClock{"clock"};
inline constexpr QLatin1String kMinus{"minus"};
inline constexpr QLatin1String kSquare{"square"};
inline constexpr QLatin1String kX{"x"};
inline constexpr QLatin1String kStar{"star"};
inline constexpr QLatin1String kExclaim{"exclaim"};
inline constexpr QLatin1String kQuestion{"question"};

// Palette order is the order offered to users.
CHECKLISTMODEL_EXPORT QStringList palette();
CHECKLISTMODEL_EXPORT bool isKnown(const QString& symbol);

} // namespace Symbols

struct CHECKLISTMODEL_EXPORT StateDefinition final {
    int number = 0;
    QString label;
    QString color;
    QString symbol;
    bool inCycle = true;

    bool isBullet() const noexcept { return number == kBulletStatus; }

    friend bool operator==(const StateDefinition& a, const StateDefinition& b)
    {
        return a.number == b.number && a.label == b.label && a.color == b.color
               && a.symbol == b.symbol && a.inCycle == b.inCycle;
    }
    friend bool operator!=(const StateDefinition& a, const StateDefinition& b) { return !(a == b); }
};

} // namespace ChecklistModel
