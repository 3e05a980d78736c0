// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/StatusCycler.hpp"

namespace ChecklistModel {

namespace {

int firstCheckbox(const StateCatalog& catalog, int current)
{
    const QVector<StateDefinition> boxes = catalog.checkboxStates();
    return boxes.isEmpty() ? current : boxes.front().number;
}

} // namespace

int StatusCycler::smartTarget(int current, const StateCatalog& catalog)
{
    const int wanted = current == 1 ? 0 : 1;
    return catalog.contains(wanted) ? wanted : firstCheckbox(catalog, current);
}

int StatusCycler::nextInCycle(int current, const StateCatalog& catalog)
{
    const QVector<StateDefinition> cycle = catalog.cycleableStates();
    if (cycle.isEmpty())
        return current;

    qsizetype idx = -1;
    for (qsizetype i = 0; i < cycle.size(); ++i) {
        if (cycle.at(i).number == current) {
            idx = i;
            break;
        }
    }
    return cycle.at((idx + 1) % cycle.size()).number;
}

int StatusCycler::toggleBullet(int current) noexcept
{
    return current == kBulletStatus ? 0 : kBulletStatus;
}

StatusCycler::Outcome StatusCycler::click(const ItemId& id, int current, const StateCatalog& catalog, qint64 nowMs)
{
    Outcome out;
    out.statusNumber = current;
    if (current == kBulletStatus)
        return out;

    const auto last = m_lastClickMs.constFind(id);
    const bool rapid = last != m_lastClickMs.cend() && nowMs - last.value() <= kRapidClickWindowMs;
    m_lastClickMs.insert(id, nowMs);

    out.gesture = rapid ? Gesture::CycleStep : Gesture::SmartClick;
    out.statusNumber = rapid ? nextInCycle(current, catalog) : smartTarget(current, catalog);
    out.changed = out.statusNumber != current;
    return out;
}

void StatusCycler::press(const ItemId& id, qint64 nowMs)
{
    m_pressStartedMs.insert(id, nowMs);
}

StatusCycler::Outcome StatusCycler::release(const ItemId& id, int current, const StateCatalog& catalog, qint64 nowMs)
{
    const auto pressed = m_pressStartedMs.constFind(id);
    if (pressed == m_pressStartedMs.cend())
        return click(id, current, catalog, nowMs);

    const qint64 heldMs = nowMs - pressed.value();
    m_pressStartedMs.erase(pressed);
    if (heldMs < kLongPressMs)
        return click(id, current, catalog, nowMs);

    // A long press starts a fresh click sequence.
    m_lastClickMs.remove(id);

    Outcome out;
    out.gesture = Gesture::LongPress;
    out.statusNumber = toggleBullet(current);
    out.changed = true;
    return out;
}

void StatusCycler::cancelPress(const ItemId& id)
{
    m_pressStartedMs.remove(id);
}

void StatusCycler::forget(const ItemId& id)
{
    m_lastClickMs.remove(id);
    m_pressStartedMs.remove(id);
}

void StatusCycler::reset()
{
    m_lastClickMs.clear();
    m_pressStartedMs.clear();
}

} // namespace ChecklistModel
