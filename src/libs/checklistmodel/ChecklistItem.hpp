// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistModelGlobal.hpp"
#include "checklistmodel/ItemId.hpp"

#include <QtCore/QString>

#include <utility>
#include <vector>

namespace ChecklistModel {

struct ChecklistItem;

// Ordered list of sibling items. Every item exclusively owns its children.
using Forest = std::vector<ChecklistItem>;

struct CHECKLISTMODEL_EXPORT ChecklistItem final {
    ItemId id;
    QString text;
    int statusNumber = 0;
    bool collapsed = false;
    Forest children;

    static ChecklistItem create(QString text, int statusNumber)
    {
        ChecklistItem item;
        item.id = ItemId::create();
        item.text = std::move(text);
        item.statusNumber = statusNumber;
        return item;
    }

    bool hasChildren() const noexcept { return !children.empty(); }

    friend bool operator==(const ChecklistItem& a, const ChecklistItem& b)
    {
        return a.id == b.id && a.text == b.text && a.statusNumber == b.statusNumber
               && a.collapsed == b.collapsed && a.children == b.children;
    }
    friend bool operator!=(const ChecklistItem& a, const ChecklistItem& b) { return !(a == b); }
};

} // namespace ChecklistModel
