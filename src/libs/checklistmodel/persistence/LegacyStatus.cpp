// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/persistence/LegacyStatus.hpp"

namespace ChecklistModel::LegacyStatus {

std::optional<Mapping> lookup(const QString& tag)
{
    const QString key = tag.trimmed().toLower();
    if (key == QLatin1String("todo"))
        return Mapping{0, Symbols::kEmpty};
    if (key == QLatin1String("done"))
        return Mapping{1, Symbols::kCheck};
    if (key == QLatin1String("waiting"))
        return Mapping{2, Symbols::kClock};
    if (key == QLatin1String("cancelled"))
        return Mapping{4, Symbols::kX};
    return std::nullopt;
}

std::optional<StateDefinition> upgrade(const QString& tag, const QString& label, const QString& color)
{
    const auto mapping = lookup(tag);
    if (!mapping)
        return std::nullopt;

    StateDefinition s;
    s.number = mapping->number;
    s.label = label.isEmpty() ? tag : label;
    s.color = color;
    s.symbol = mapping->symbol;
    s.inCycle = true;
    return s;
}

} // namespace ChecklistModel::LegacyStatus
