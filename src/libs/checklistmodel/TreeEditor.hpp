// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistItem.hpp"
#include "checklistmodel/ChecklistModelGlobal.hpp"
#include "checklistmodel/TreeEditResult.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace ChecklistModel {

enum class DropZone : quint8 {
    Before,
    After,
    Inside,
    End
};

CHECKLISTMODEL_EXPORT QString toString(DropZone zone);

// Structural edits over a forest value. Every mutation takes the forest by
// const reference and returns the edited copy; a failed edit returns no forest.
// Lookups use pre-order depth-first search, first match wins.
namespace TreeEditor {

CHECKLISTMODEL_EXPORT TreeEditResult appendRoot(const Forest& forest, ChecklistItem item);
CHECKLISTMODEL_EXPORT TreeEditResult insertAfter(const Forest& forest, const ItemId& refId, ChecklistItem item);
CHECKLISTMODEL_EXPORT TreeEditResult appendChild(const Forest& forest, const ItemId& parentId, ChecklistItem item);
CHECKLISTMODEL_EXPORT TreeEditResult remove(const Forest& forest, const ItemId& id);

CHECKLISTMODEL_EXPORT TreeEditResult indent(const Forest& forest, const ItemId& id);
CHECKLISTMODEL_EXPORT TreeEditResult outdent(const Forest& forest, const ItemId& id);

// Moves the source subtree relative to target. A null target is accepted
// only with DropZone::End, which appends to the root list.
CHECKLISTMODEL_EXPORT TreeEditResult relocate(const Forest& forest,
                                              const ItemId& sourceId,
                                              const ItemId& targetId,
                                              DropZone zone);

CHECKLISTMODEL_EXPORT TreeEditResult updateText(const Forest& forest, const ItemId& id, const QString& text);
CHECKLISTMODEL_EXPORT TreeEditResult updateStatus(const Forest& forest, const ItemId& id, int statusNumber);
CHECKLISTMODEL_EXPORT TreeEditResult setCollapsed(const Forest& forest, const ItemId& id, bool collapsed);

CHECKLISTMODEL_EXPORT const ChecklistItem* find(const Forest& forest, const ItemId& id);
CHECKLISTMODEL_EXPORT bool contains(const Forest& forest, const ItemId& id);

// True iff id lies strictly inside ancestorId's subtree.
CHECKLISTMODEL_EXPORT bool isDescendant(const Forest& forest, const ItemId& ancestorId, const ItemId& id);

// Null for root items and unknown ids.
CHECKLISTMODEL_EXPORT ItemId parentOf(const Forest& forest, const ItemId& id);

CHECKLISTMODEL_EXPORT int count(const Forest& forest);
CHECKLISTMODEL_EXPORT int subtreeSize(const ChecklistItem& item);
CHECKLISTMODEL_EXPORT QVector<ItemId> collectIds(const Forest& forest);
CHECKLISTMODEL_EXPORT std::optional<ItemId> findDuplicateId(const Forest& forest);

} // namespace TreeEditor

} // namespace ChecklistModel
