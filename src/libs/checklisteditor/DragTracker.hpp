// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklisteditor/ChecklistEditorGlobal.hpp"

#include <checklistmodel/ItemId.hpp>
#include <checklistmodel/TreeEditor.hpp>

#include <QtCore/QPoint>

namespace ChecklistEditor {

// Pointer-down arms a pending drag; moving past the start distance promotes
// it. The tracker never starts the drag itself.
class CHECKLISTEDITOR_EXPORT DragTracker final {
public:
    explicit DragTracker(int startDistance);

    void arm(const ChecklistModel::ItemId& id, const QPoint& pos);
    // True once the pointer has travelled startDistance from the armed position.
    bool update(const QPoint& pos);
    void reset();

    bool isArmed() const noexcept { return !m_id.isNull(); }
    const ChecklistModel::ItemId& itemId() const noexcept { return m_id; }
    int startDistance() const noexcept { return m_startDistance; }

    // Zone for a pointer at y over a row spanning [top, top + height).
    static ChecklistModel::DropZone zoneForPosition(int y, int top, int height);

private:
    int m_startDistance = 0;
    ChecklistModel::ItemId m_id;
    QPoint m_origin;
};

} // namespace ChecklistEditor
