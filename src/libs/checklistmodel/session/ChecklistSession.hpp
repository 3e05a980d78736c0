// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklistmodel/Checklist.hpp"
#include "checklistmodel/ChecklistModelGlobal.hpp"
#include "checklistmodel/StatusCycler.hpp"
#include "checklistmodel/TreeEditor.hpp"
#include "checklistmodel/persistence/ChecklistXml.hpp"

#include "utils/Result.hpp"
#include "utils/async/DebouncedInvoker.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <functional>

namespace ChecklistModel {

// Owns the open checklist. Every successful mutation notifies listeners and
// arms one restartable save timer, so a burst of edits is written once.
class CHECKLISTMODEL_EXPORT ChecklistSession final : public QObject
{
    Q_OBJECT

public:
    static constexpr int kSaveDebounceMs = 400;

    // Monotonic milliseconds.
    using Clock = std::function<qint64()>;

    explicit ChecklistSession(QObject* parent = nullptr);
    ~ChecklistSession() override;

    bool hasChecklist() const noexcept { return m_hasChecklist; }
    const Checklist& checklist() const noexcept { return m_checklist; }
    const QString& path() const noexcept { return m_path; }

    // Flushes the current checklist first. The loaded checklist is installed
    // even when the result is not Ok, but then it is not bound to path and
    // nothing is saved there.
    ChecklistLoadResult open(const QString& path);
    // An empty path keeps the checklist in memory only.
    void setChecklist(Checklist checklist, const QString& path = {});
    void close();

    const ChecklistItem* item(const ItemId& id) const;

    ItemId addRootItem(const QString& text = {});
    ItemId addSiblingAfter(const ItemId& refId, const QString& text = {});
    ItemId addChild(const ItemId& parentId, const QString& text = {});
    bool removeItem(const ItemId& id);
    bool indentItem(const ItemId& id);
    bool outdentItem(const ItemId& id);
    bool dropItem(const ItemId& sourceId, const ItemId& targetId, DropZone zone);

    bool setItemText(const ItemId& id, const QString& text);
    bool setItemStatus(const ItemId& id, int statusNumber);
    bool setItemCollapsed(const ItemId& id, bool collapsed);

    void pressIndicator(const ItemId& id);
    bool releaseIndicator(const ItemId& id);
    void cancelIndicatorPress(const ItemId& id);

    void replaceCatalog(StateCatalog catalog);
    void rename(const QString& name);

    void setClock(Clock clock);
    void setSaveDelayMs(int ms);
    int saveDelayMs() const;

    bool hasPendingSave() const;
    void scheduleSave();
    // Writes immediately if a save is pending.
    void flush();
    Utils::Result saveNow();

signals:
    void checklistChanged();
    void itemChanged(const ChecklistModel::ItemId& id);
    void focusRequested(const ChecklistModel::ItemId& id);
    void saved(const QString& path);
    void saveFailed(const QString& message);
    void editRejected(ChecklistModel::TreeEditError error, const QString& message);

private:
    ChecklistItem newItem(const QString& text) const;
    ItemId applyStructural(TreeEditResult result);
    bool applyItemUpdate(TreeEditResult result, const ItemId& id);
    bool reject(const TreeEditResult& result);
    qint64 now() const;

    Checklist m_checklist;
    QString m_path;
    bool m_hasChecklist = false;

    StatusCycler m_cycler;
    Clock m_clock;
    QElapsedTimer m_elapsed;

    Utils::Async::DebouncedInvoker m_saveDebounce;
};

} // namespace ChecklistModel
