// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklistmodel/session/ChecklistSession.hpp"

#include <utility>

namespace ChecklistModel {

ChecklistSession::ChecklistSession(QObject* parent)
    : QObject(parent)
    , m_saveDebounce(this)
{
    m_elapsed.start();
    m_saveDebounce.setDelayMs(kSaveDebounceMs);
    m_saveDebounce.setAction([this]() { saveNow(); });
}

ChecklistSession::~ChecklistSession() = default;

ChecklistLoadResult ChecklistSession::open(const QString& path)
{
    flush();

    ChecklistLoadResult result = ChecklistXml::load(path);
    if (!result.ok()) {
        // Show the placeholder but never write it back over the original file.
        qCWarning(checklistsessionlog).noquote() << "Could not open" << path << "-" << result.error;
        setChecklist(result.checklist);
        return result;
    }

    qCInfo(checklistsessionlog).noquote() << "Opened" << path;
    setChecklist(result.checklist, path);
    return result;
}

void ChecklistSession::setChecklist(Checklist checklist, const QString& path)
{
    flush();
    m_checklist = std::move(checklist);
    m_path = path;
    m_hasChecklist = true;
    m_cycler.reset();

    if (const auto dup = TreeEditor::findDuplicateId(m_checklist.items)) {
        qCWarning(checklistsessionlog).noquote() << "Duplicate item id in checklist:" << dup->toString();
        Q_ASSERT_X(false, "ChecklistSession::setChecklist", "item ids must be unique");
    }
    emit checklistChanged();
}

void ChecklistSession::close()
{
    flush();
    m_checklist = Checklist{};
    m_path.clear();
    m_hasChecklist = false;
    m_cycler.reset();
    emit checklistChanged();
}

const ChecklistItem* ChecklistSession::item(const ItemId& id) const
{
    return TreeEditor::find(m_checklist.items, id);
}

ChecklistItem ChecklistSession::newItem(const QString& text) const
{
    ChecklistItem item = ChecklistItem::create(text, m_checklist.catalog.defaultStatusNumber());
    while (TreeEditor::contains(m_checklist.items, item.id))
        item.id = ItemId::create();
    return item;
}

ItemId ChecklistSession::addRootItem(const QString& text)
{
    if (!m_hasChecklist)
        return {};
    return applyStructural(TreeEditor::appendRoot(m_checklist.items, newItem(text)));
}

ItemId ChecklistSession::addSiblingAfter(const ItemId& refId, const QString& text)
{
    if (!m_hasChecklist)
        return {};
    return applyStructural(TreeEditor::insertAfter(m_checklist.items, refId, newItem(text)));
}

ItemId ChecklistSession::addChild(const ItemId& parentId, const QString& text)
{
    if (!m_hasChecklist)
        return {};
    return applyStructural(TreeEditor::appendChild(m_checklist.items, parentId, newItem(text)));
}

bool ChecklistSession::removeItem(const ItemId& id)
{
    TreeEditResult result = TreeEditor::remove(m_checklist.items, id);
    if (!result.ok())
        return reject(result);

    if (const auto& removed = result.removedSubtree()) {
        for (const ItemId& gone : TreeEditor::collectIds({*removed}))
            m_cycler.forget(gone);
    }
    applyStructural(std::move(result));
    return true;
}

bool ChecklistSession::indentItem(const ItemId& id)
{
    TreeEditResult result = TreeEditor::indent(m_checklist.items, id);
    if (!result.ok())
        return reject(result);
    applyStructural(std::move(result));
    return true;
}

bool ChecklistSession::outdentItem(const ItemId& id)
{
    TreeEditResult result = TreeEditor::outdent(m_checklist.items, id);
    if (!result.ok())
        return reject(result);
    applyStructural(std::move(result));
    return true;
}

bool ChecklistSession::dropItem(const ItemId& sourceId, const ItemId& targetId, DropZone zone)
{
    TreeEditResult result = TreeEditor::relocate(m_checklist.items, sourceId, targetId, zone);
    if (!result.ok())
        return reject(result);

    qCDebug(checklistsessionlog).noquote()
        << "Dropped" << sourceId.toString() << toString(zone) << targetId.toString();
    applyStructural(std::move(result));
    return true;
}

bool ChecklistSession::setItemText(const ItemId& id, const QString& text)
{
    const ChecklistItem* current = item(id);
    if (current && current->text == text)
        return true;
    return applyItemUpdate(TreeEditor::updateText(m_checklist.items, id, text), id);
}

bool ChecklistSession::setItemStatus(const ItemId& id, int statusNumber)
{
    const ChecklistItem* current = item(id);
    if (current && current->statusNumber == statusNumber)
        return true;
    return applyItemUpdate(TreeEditor::updateStatus(m_checklist.items, id, statusNumber), id);
}

bool ChecklistSession::setItemCollapsed(const ItemId& id, bool collapsed)
{
    const ChecklistItem* current = item(id);
    if (current && current->collapsed == (collapsed && current->hasChildren()))
        return true;
    return applyItemUpdate(TreeEditor::setCollapsed(m_checklist.items, id, collapsed), id);
}

void ChecklistSession::pressIndicator(const ItemId& id)
{
    if (item(id))
        m_cycler.press(id, now());
}

bool ChecklistSession::releaseIndicator(const ItemId& id)
{
    const ChecklistItem* current = item(id);
    if (!current) {
        m_cycler.cancelPress(id);
        return false;
    }

    const StatusCycler::Outcome outcome =
        m_cycler.release(id, current->statusNumber, m_checklist.catalog, now());
    if (!outcome.changed)
        return false;
    return setItemStatus(id, outcome.statusNumber);
}

void ChecklistSession::cancelIndicatorPress(const ItemId& id)
{
    m_cycler.cancelPress(id);
}

void ChecklistSession::replaceCatalog(StateCatalog catalog)
{
    if (!m_hasChecklist || m_checklist.catalog == catalog)
        return;
    m_checklist.catalog = std::move(catalog);
    emit checklistChanged();
    scheduleSave();
}

void ChecklistSession::rename(const QString& name)
{
    const QString trimmed = name.trimmed();
    if (!m_hasChecklist || trimmed.isEmpty() || trimmed == m_checklist.name)
        return;
    m_checklist.name = trimmed;
    emit checklistChanged();
    scheduleSave();
    flush();
}

void ChecklistSession::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

void ChecklistSession::setSaveDelayMs(int ms)
{
    m_saveDebounce.setDelayMs(ms);
}

int ChecklistSession::saveDelayMs() const
{
    return m_saveDebounce.delayMs();
}

bool ChecklistSession::hasPendingSave() const
{
    return m_saveDebounce.isPending();
}

void ChecklistSession::scheduleSave()
{
    if (!m_hasChecklist || m_path.isEmpty())
        return;
    m_saveDebounce.trigger();
}

void ChecklistSession::flush()
{
    m_saveDebounce.flush();
}

Utils::Result ChecklistSession::saveNow()
{
    m_saveDebounce.cancel();
    if (!m_hasChecklist || m_path.isEmpty())
        return Utils::Result::failure(QStringLiteral("No checklist file to save."));

    const Utils::Result r = ChecklistXml::save(m_checklist, m_path);
    if (!r) {
        qCWarning(checklistsessionlog).noquote() << "Save failed:" << r.errorString();
        emit saveFailed(r.errorString());
        return r;
    }

    qCDebug(checklistsessionlog).noquote() << "Saved" << m_path;
    emit saved(m_path);
    return r;
}

ItemId ChecklistSession::applyStructural(TreeEditResult result)
{
    if (!result.ok()) {
        reject(result);
        return {};
    }

    const ItemId focus = result.focusId();
    m_checklist.items = result.takeForest();
    Q_ASSERT(!TreeEditor::findDuplicateId(m_checklist.items).has_value());

    emit checklistChanged();
    if (!focus.isNull())
        emit focusRequested(focus);
    scheduleSave();
    return focus;
}

bool ChecklistSession::applyItemUpdate(TreeEditResult result, const ItemId& id)
{
    if (!result.ok())
        return reject(result);

    m_checklist.items = result.takeForest();
    emit itemChanged(id);
    scheduleSave();
    return true;
}

bool ChecklistSession::reject(const TreeEditResult& result)
{
    emit editRejected(result.error(), result.message());
    return false;
}

qint64 ChecklistSession::now() const
{
    return m_clock ? m_clock() : m_elapsed.elapsed();
}

} // namespace ChecklistModel
