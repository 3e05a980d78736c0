// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/ChecklistItem.hpp"
#include "checklistmodel/ChecklistModelGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <optional>
#include <utility>

namespace ChecklistModel {

enum class TreeEditError : quint8 {
    None = 0,
    InvalidArgument,
    NotFound,
    NoPrecedingSibling,
    AtRoot,
    CycleRejected,
    DuplicateId
};

CHECKLISTMODEL_EXPORT QString toString(TreeEditError error);

// Outcome of a forest edit. On failure the caller keeps its forest untouched.
class CHECKLISTMODEL_EXPORT TreeEditResult final {
public:
    TreeEditResult() = default;

    static TreeEditResult success(Forest forest, ItemId focus = {})
    {
        TreeEditResult r;
        r.m_error = TreeEditError::None;
        r.m_forest = std::move(forest);
        r.m_focus = std::move(focus);
        return r;
    }

    static TreeEditResult removed(Forest forest, ChecklistItem subtree)
    {
        TreeEditResult r = success(std::move(forest));
        r.m_removed = std::move(subtree);
        return r;
    }

    static TreeEditResult failure(TreeEditError error, QString message)
    {
        TreeEditResult r;
        r.m_error = error;
        r.m_message = std::move(message);
        return r;
    }

    bool ok() const noexcept { return m_error == TreeEditError::None; }
    TreeEditError error() const noexcept { return m_error; }
    const QString& message() const noexcept { return m_message; }

    const Forest& forest() const noexcept { return m_forest; }
    Forest takeForest() { return std::move(m_forest); }

    // Item the view should focus after applying the edit; null when none.
    const ItemId& focusId() const noexcept { return m_focus; }
    const std::optional<ChecklistItem>& removedSubtree() const noexcept { return m_removed; }

private:
    TreeEditError m_error{TreeEditError::InvalidArgument};
    QString m_message;
    Forest m_forest;
    ItemId m_focus;
    std::optional<ChecklistItem> m_removed;
};

} // namespace ChecklistModel

Q_DECLARE_METATYPE(ChecklistModel::TreeEditError)
