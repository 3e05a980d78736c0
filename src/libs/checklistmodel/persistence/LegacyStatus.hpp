// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"
#include "checklistmodel/StateDefinition.hpp"

#include <QtCore/QString>

#include <optional>

namespace ChecklistModel::LegacyStatus {

// Documents written before numeric statuses carry one of four string tags.
// The mapping is fixed: todo 0, done 1, waiting 2, cancelled 4.
struct Mapping final {
    int number = 0;
    QLatin1String symbol;
};

CHECKLISTMODEL_EXPORT std::optional<Mapping> lookup(const QString& tag);

// Upgrades a legacy <state id="tag"> definition; nullopt for unknown tags.
CHECKLISTMODEL_EXPORT std::optional<StateDefinition> upgrade(const QString& tag,
                                                             const QString& label,
                                                             const QString& color);

} // namespace ChecklistModel::LegacyStatus
