// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklisteditor/ChecklistEditorGlobal.hpp"

#include <checklistmodel/ChecklistItem.hpp>

#include <utils/TreeIndex.hpp>

#include <QtCore/QAbstractItemModel>
#include <QtCore/QHash>
#include <QtCore/QPointer>

class QMimeData;

namespace ChecklistModel {
class ChecklistSession;
}

namespace ChecklistEditor {

// Item model over the session's forest. The node table is rebuilt on every
// structural change and never written back; edits go through the session.
class CHECKLISTEDITOR_EXPORT ChecklistTreeModel final : public QAbstractItemModel
{
    Q_OBJECT

public:
    enum Role {
        IdRole = Qt::UserRole + 1,
        StatusNumberRole,
        SymbolRole,
        ColorRole,
        CollapsedRole,
        StatusLabelRole
    };

    static constexpr char kMimeType[] = "application/x-checklist-item";

    explicit ChecklistTreeModel(ChecklistModel::ChecklistSession* session, QObject* parent = nullptr);

    ChecklistModel::ChecklistSession* session() const;

    QModelIndex indexForId(const ChecklistModel::ItemId& id) const;
    ChecklistModel::ItemId idForIndex(const QModelIndex& index) const;

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QModelIndex index(int row, int column, const QModelIndex& parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex& index) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    bool setData(const QModelIndex& index, const QVariant& value, int role = Qt::EditRole) override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;

    Qt::DropActions supportedDragActions() const override;
    Qt::DropActions supportedDropActions() const override;
    QStringList mimeTypes() const override;
    QMimeData* mimeData(const QModelIndexList& indexes) const override;

    static ChecklistModel::ItemId decodeMimeData(const QMimeData* mime);

private:
    using Tree = Utils::TreeIndex<ChecklistModel::ItemId>;

    void rebuild();
    void handleItemChanged(const ChecklistModel::ItemId& id);
    void addNodes(Utils::TreeNodeId parent, const ChecklistModel::Forest& items);
    void cacheItems(const ChecklistModel::Forest& items);
    const Tree::Node* nodeFromIndex(const QModelIndex& index) const;
    QModelIndex indexForNode(const Tree::Node* node) const;
    const ChecklistModel::ChecklistItem* itemFromIndex(const QModelIndex& index) const;

    QPointer<ChecklistModel::ChecklistSession> m_session;
    Tree m_tree;
    QHash<ChecklistModel::ItemId, Utils::TreeNodeId> m_nodeIndex;
    // Points into the session's forest; refreshed whenever the session swaps it.
    QHash<Utils::TreeNodeId, const ChecklistModel::ChecklistItem*> m_items;
};

} // namespace ChecklistEditor
