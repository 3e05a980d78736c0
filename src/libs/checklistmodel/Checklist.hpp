// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistItem.hpp"
#include "checklistmodel/ChecklistModelGlobal.hpp"
#include "checklistmodel/StateCatalog.hpp"

#include <QtCore/QString>

#include <utility>

namespace ChecklistModel {

struct CHECKLISTMODEL_EXPORT Checklist final {
    QString name = QStringLiteral("Untitled");
    StateCatalog catalog = StateCatalog::defaultCatalog();
    Forest items;

    static Checklist createEmpty(QString name)
    {
        Checklist c;
        if (!name.trimmed().isEmpty())
            c.name = std::move(name);
        return c;
    }

    friend bool operator==(const Checklist& a, const Checklist& b)
    {
        return a.name == b.name && a.catalog == b.catalog && a.items == b.items;
    }
    friend bool operator!=(const Checklist& a, const Checklist& b) { return !(a == b); }
};

} // namespace ChecklistModel
