// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/ChecklistTreeModel.hpp"

#include <checklistmodel/session/ChecklistSession.hpp>

#include <QtCore/QMimeData>
#include <QtCore/QStringList>

namespace ChecklistEditor {

using ChecklistModel::ChecklistItem;
using ChecklistModel::ItemId;

ChecklistTreeModel::ChecklistTreeModel(ChecklistModel::ChecklistSession* session, QObject* parent)
    : QAbstractItemModel(parent)
    , m_session(session)
{
    rebuild();
    if (!m_session)
        return;

    connect(m_session, &ChecklistModel::ChecklistSession::checklistChanged, this, [this]() {
        beginResetModel();
        rebuild();
        endResetModel();
    });
    connect(m_session, &ChecklistModel::ChecklistSession::itemChanged,
            this, &ChecklistTreeModel::handleItemChanged);
}

ChecklistModel::ChecklistSession* ChecklistTreeModel::session() const
{
    return m_session;
}

QModelIndex ChecklistTreeModel::indexForId(const ItemId& id) const
{
    const auto it = m_nodeIndex.constFind(id);
    if (it == m_nodeIndex.cend())
        return {};
    return indexForNode(m_tree.node(it.value()));
}

ItemId ChecklistTreeModel::idForIndex(const QModelIndex& index) const
{
    const Tree::Node* node = nodeFromIndex(index);
    return node ? node->payload : ItemId();
}

int ChecklistTreeModel::rowCount(const QModelIndex& parent) const
{
    if (parent.column() > 0)
        return 0;
    if (!parent.isValid())
        return m_tree.childCount(m_tree.rootId());

    const Tree::Node* node = nodeFromIndex(parent);
    return node ? node->children.size() : 0;
}

int ChecklistTreeModel::columnCount(const QModelIndex& parent) const
{
    Q_UNUSED(parent);
    return 1;
}

QModelIndex ChecklistTreeModel::index(int row, int column, const QModelIndex& parent) const
{
    if (column != 0 || row < 0)
        return {};

    Utils::TreeNodeId parentId = m_tree.rootId();
    if (parent.isValid()) {
        const Tree::Node* parentNode = nodeFromIndex(parent);
        if (!parentNode)
            return {};
        parentId = parentNode->id;
    }

    const Utils::TreeNodeId childId = m_tree.childAt(parentId, row);
    const Tree::Node* child = m_tree.node(childId);
    if (!child)
        return {};
    return createIndex(row, 0, const_cast<Tree::Node*>(child));
}

QModelIndex ChecklistTreeModel::parent(const QModelIndex& index) const
{
    const Tree::Node* node = nodeFromIndex(index);
    if (!node || node->parent == m_tree.rootId())
        return {};
    return indexForNode(m_tree.node(node->parent));
}

QVariant ChecklistTreeModel::data(const QModelIndex& index, int role) const
{
    const ChecklistItem* item = itemFromIndex(index);
    if (!item)
        return {};

    switch (role) {
        case Qt::DisplayRole:
        case Qt::EditRole:
            return item->text;
        case IdRole:
            return QVariant::fromValue(item->id);
        case StatusNumberRole:
            return item->statusNumber;
        case CollapsedRole:
            return item->collapsed;
        default:
            break;
    }

    if (role == SymbolRole || role == ColorRole || role == StatusLabelRole || role == Qt::ToolTipRole) {
        const ChecklistModel::StateDefinition state = m_session->checklist().catalog.resolve(item->statusNumber);
        if (role == SymbolRole)
            return state.symbol;
        if (role == ColorRole)
            return state.color;
        return state.label;
    }
    return {};
}

bool ChecklistTreeModel::setData(const QModelIndex& index, const QVariant& value, int role)
{
    if (role != Qt::EditRole || !m_session)
        return false;

    const ItemId id = idForIndex(index);
    if (id.isNull())
        return false;
    return m_session->setItemText(id, value.toString());
}

Qt::ItemFlags ChecklistTreeModel::flags(const QModelIndex& index) const
{
    if (!index.isValid())
        return Qt::ItemIsDropEnabled;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsEditable
           | Qt::ItemIsDragEnabled | Qt::ItemIsDropEnabled;
}

Qt::DropActions ChecklistTreeModel::supportedDragActions() const
{
    return Qt::MoveAction;
}

Qt::DropActions ChecklistTreeModel::supportedDropActions() const
{
    return Qt::MoveAction;
}

QStringList ChecklistTreeModel::mimeTypes() const
{
    return { QString::fromLatin1(kMimeType) };
}

QMimeData* ChecklistTreeModel::mimeData(const QModelIndexList& indexes) const
{
    // One item per drag; the first valid index wins.
    for (const QModelIndex& index : indexes) {
        const ItemId id = idForIndex(index);
        if (id.isNull())
            continue;
        auto* mime = new QMimeData();
        mime->setData(QString::fromLatin1(kMimeType), id.toString().toUtf8());
        return mime;
    }
    return nullptr;
}

ItemId ChecklistTreeModel::decodeMimeData(const QMimeData* mime)
{
    const QString format = QString::fromLatin1(kMimeType);
    if (!mime || !mime->hasFormat(format))
        return {};
    return ItemId(QString::fromUtf8(mime->data(format)).trimmed());
}

void ChecklistTreeModel::rebuild()
{
    m_nodeIndex.clear();
    m_items.clear();
    const Utils::TreeNodeId root = m_tree.createRoot();
    if (m_session && m_session->hasChecklist())
        addNodes(root, m_session->checklist().items);
}

void ChecklistTreeModel::addNodes(Utils::TreeNodeId parent, const ChecklistModel::Forest& items)
{
    for (const ChecklistItem& item : items) {
        const Utils::TreeNodeId nodeId = m_tree.addChild(parent, item.id);
        m_nodeIndex.insert(item.id, nodeId);
        m_items.insert(nodeId, &item);
        addNodes(nodeId, item.children);
    }
}

void ChecklistTreeModel::cacheItems(const ChecklistModel::Forest& items)
{
    for (const ChecklistItem& item : items) {
        const auto it = m_nodeIndex.constFind(item.id);
        if (it != m_nodeIndex.cend())
            m_items.insert(it.value(), &item);
        cacheItems(item.children);
    }
}

void ChecklistTreeModel::handleItemChanged(const ItemId& id)
{
    // Item updates replace the forest without changing its shape.
    if (m_session && m_session->hasChecklist())
        cacheItems(m_session->checklist().items);

    const QModelIndex index = indexForId(id);
    if (index.isValid())
        emit dataChanged(index, index);
}

const ChecklistTreeModel::Tree::Node* ChecklistTreeModel::nodeFromIndex(const QModelIndex& index) const
{
    if (!index.isValid() || index.model() != this)
        return nullptr;
    return static_cast<const Tree::Node*>(index.internalPointer());
}

QModelIndex ChecklistTreeModel::indexForNode(const Tree::Node* node) const
{
    if (!node || node->id == m_tree.rootId())
        return {};
    const int row = m_tree.rowOf(node->id);
    if (row < 0)
        return {};
    return createIndex(row, 0, const_cast<Tree::Node*>(node));
}

const ChecklistItem* ChecklistTreeModel::itemFromIndex(const QModelIndex& index) const
{
    const Tree::Node* node = nodeFromIndex(index);
    return node ? m_items.value(node->id, nullptr) : nullptr;
}

} // namespace ChecklistEditor
