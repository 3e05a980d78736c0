// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/DragTracker.hpp"

#include <algorithm>

namespace ChecklistEditor {

using ChecklistModel::DropZone;

DragTracker::DragTracker(int startDistance)
    : m_startDistance(std::max(startDistance, 0))
{
}

void DragTracker::arm(const ChecklistModel::ItemId& id, const QPoint& pos)
{
    m_id = id;
    m_origin = pos;
}

bool DragTracker::update(const QPoint& pos)
{
    if (!isArmed())
        return false;
    return (pos - m_origin).manhattanLength() >= m_startDistance;
}

void DragTracker::reset()
{
    m_id = ChecklistModel::ItemId();
    m_origin = QPoint();
}

DropZone DragTracker::zoneForPosition(int y, int top, int height)
{
    if (height <= 0)
        return DropZone::Inside;

    const double rel = static_cast<double>(y - top) / static_cast<double>(height);
    if (rel < 0.25)
        return DropZone::Before;
    if (rel > 0.75)
        return DropZone::After;
    return DropZone::Inside;
}

} // namespace ChecklistEditor
