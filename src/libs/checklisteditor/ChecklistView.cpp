// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/ChecklistView.hpp"

#include "checklisteditor/ChecklistTreeModel.hpp"
#include "checklisteditor/views/ChecklistItemDelegate.hpp"

#include <checklistmodel/session/ChecklistSession.hpp>

#include <utils/contextmenu/ContextMenu.hpp>

#include <QtCore/QMimeData>
#include <QtCore/QScopedValueRollback>
#include <QtGui/QContextMenuEvent>
#include <QtGui/QDrag>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <QtWidgets/QApplication>

#include <utility>

namespace ChecklistEditor {

namespace {

using ChecklistModel::DropZone;
using ChecklistModel::ItemId;
using Utils::ContextMenuAction;

const QString kAddRootActionId = QStringLiteral("checklist.item.addRoot");
const QString kAddSiblingActionId = QStringLiteral("checklist.item.addSibling");
const QString kAddChildActionId = QStringLiteral("checklist.item.addChild");
const QString kIndentActionId = QStringLiteral("checklist.item.indent");
const QString kOutdentActionId = QStringLiteral("checklist.item.outdent");
const QString kDeleteActionId = QStringLiteral("checklist.item.delete");
const QString kSetStatePrefix = QStringLiteral("checklist.item.state.");

ContextMenuAction makeAction(const QString& id, const QString& text, bool enabled = true)
{
    ContextMenuAction action = ContextMenuAction::item(id, text);
    action.enabled = enabled;
    return action;
}

} // namespace

ChecklistView::ChecklistView(ChecklistModel::ChecklistSession* session, QWidget* parent)
    : QTreeView(parent)
    , m_session(session)
    , m_dragTracker(QApplication::startDragDistance())
{
    setObjectName(QStringLiteral("ChecklistView"));
    setHeaderHidden(true);
    setSelectionBehavior(QAbstractItemView::SelectRows);
    setSelectionMode(QAbstractItemView::SingleSelection);
    setEditTriggers(QAbstractItemView::DoubleClicked | QAbstractItemView::SelectedClicked
                    | QAbstractItemView::EditKeyPressed);
    setExpandsOnDoubleClick(false);
    setDragEnabled(false);
    setAcceptDrops(true);
    viewport()->setAcceptDrops(true);
    setDropIndicatorShown(false);
    setIndentation(20);

    m_model = new ChecklistTreeModel(session, this);
    setModel(m_model);
    m_delegate = new ChecklistItemDelegate(this);
    setItemDelegate(m_delegate);

    m_contextMenu = new Utils::ContextMenu(this);
    connect(m_contextMenu, &Utils::ContextMenu::actionTriggered,
            this, &ChecklistView::handleContextAction);

    connect(m_model, &QAbstractItemModel::modelAboutToBeReset, this, [this]() {
        m_restoreId = currentItemId();
        m_dropTarget.reset();
    });
    connect(m_model, &QAbstractItemModel::modelReset, this, [this]() {
        syncExpansion(QModelIndex());
        const QModelIndex restored = m_model->indexForId(std::exchange(m_restoreId, ItemId()));
        if (restored.isValid())
            setCurrentIndex(restored);
    });

    connect(this, &QTreeView::expanded, this, [this](const QModelIndex& index) {
        handleExpansion(index, true);
    });
    connect(this, &QTreeView::collapsed, this, [this](const QModelIndex& index) {
        handleExpansion(index, false);
    });

    if (m_session) {
        connect(m_session, &ChecklistModel::ChecklistSession::focusRequested,
                this, &ChecklistView::handleFocusRequested);
    }

    syncExpansion(QModelIndex());
}

ItemId ChecklistView::currentItemId() const
{
    return m_model->idForIndex(currentIndex());
}

void ChecklistView::setMaxItemWidth(int width)
{
    setMaximumWidth(width);
}

bool ChecklistView::event(QEvent* event)
{
    // Tab would otherwise move focus out of the view.
    if (event->type() == QEvent::KeyPress) {
        auto* key = static_cast<QKeyEvent*>(event);
        if (key->key() == Qt::Key_Tab && !(key->modifiers() & ~Qt::KeypadModifier)) {
            indentCurrent();
            return true;
        }
        if (key->key() == Qt::Key_Backtab) {
            outdentCurrent();
            return true;
        }
    }
    return QTreeView::event(event);
}

void ChecklistView::keyPressEvent(QKeyEvent* event)
{
    if (!m_session || state() == QAbstractItemView::EditingState) {
        QTreeView::keyPressEvent(event);
        return;
    }

    const ItemId id = currentItemId();
    switch (event->key()) {
        case Qt::Key_Return:
        case Qt::Key_Enter:
            if (id.isNull())
                m_session->addRootItem();
            else
                m_session->addSiblingAfter(id);
            event->accept();
            return;
        case Qt::Key_Delete:
            if (!id.isNull())
                m_session->removeItem(id);
            event->accept();
            return;
        case Qt::Key_Space:
            if (!id.isNull())
                m_session->releaseIndicator(id);
            event->accept();
            return;
        default:
            break;
    }
    QTreeView::keyPressEvent(event);
}

bool ChecklistView::beginIndicatorPress(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton)
        return false;

    const QPoint pos = event->position().toPoint();
    const QModelIndex index = indexAt(pos);
    if (!index.isValid() || !indicatorHit(index, pos))
        return false;

    m_dragTracker.reset();
    m_pressedIndicator = m_model->idForIndex(index);
    if (m_session)
        m_session->pressIndicator(m_pressedIndicator);
    setCurrentIndex(index);
    event->accept();
    return true;
}

void ChecklistView::mousePressEvent(QMouseEvent* event)
{
    if (beginIndicatorPress(event))
        return;

    const QPoint pos = event->position().toPoint();
    const QModelIndex index = indexAt(pos);
    if (event->button() == Qt::LeftButton && index.isValid())
        m_dragTracker.arm(m_model->idForIndex(index), pos);
    else
        m_dragTracker.reset();
    QTreeView::mousePressEvent(event);
}

void ChecklistView::mouseDoubleClickEvent(QMouseEvent* event)
{
    // The second click of a rapid pair arrives here.
    if (beginIndicatorPress(event))
        return;
    QTreeView::mouseDoubleClickEvent(event);
}

void ChecklistView::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_pressedIndicator.isNull()) {
        event->accept();
        return;
    }

    if ((event->buttons() & Qt::LeftButton) && state() != QAbstractItemView::EditingState
        && m_dragTracker.update(event->position().toPoint())) {
        const ItemId id = m_dragTracker.itemId();
        m_dragTracker.reset();
        startItemDrag(id);
        event->accept();
        return;
    }
    QTreeView::mouseMoveEvent(event);
}

void ChecklistView::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_pressedIndicator.isNull()) {
        const ItemId id = std::exchange(m_pressedIndicator, ItemId());
        const QPoint pos = event->position().toPoint();
        const QModelIndex index = indexAt(pos);
        if (m_session) {
            if (index.isValid() && m_model->idForIndex(index) == id && indicatorHit(index, pos))
                m_session->releaseIndicator(id);
            else
                m_session->cancelIndicatorPress(id);
        }
        event->accept();
        return;
    }

    m_dragTracker.reset();
    QTreeView::mouseReleaseEvent(event);
}

void ChecklistView::contextMenuEvent(QContextMenuEvent* event)
{
    if (!m_session || !m_session->hasChecklist())
        return;

    const QModelIndex index = indexAt(event->pos());
    m_contextId = m_model->idForIndex(index);

    QList<ContextMenuAction> actions;
    if (m_contextId.isNull()) {
        actions.push_back(makeAction(kAddRootActionId, QStringLiteral("Add Item")));
    } else {
        const ChecklistModel::ChecklistItem* item = m_session->item(m_contextId);
        QList<ContextMenuAction> states;
        for (const ChecklistModel::StateDefinition& state : m_session->checklist().catalog.states()) {
            ContextMenuAction entry = makeAction(kSetStatePrefix + QString::number(state.number), state.label);
            entry.checkable = true;
            entry.checked = item && item->statusNumber == state.number;
            states.push_back(entry);
        }

        actions.push_back(ContextMenuAction::submenu(QStringLiteral("Set State"), states));
        actions.push_back(ContextMenuAction::separatorAction());
        actions.push_back(makeAction(kAddSiblingActionId, QStringLiteral("Add Sibling Below")));
        actions.push_back(makeAction(kAddChildActionId, QStringLiteral("Add Child")));
        actions.push_back(ContextMenuAction::separatorAction());
        actions.push_back(makeAction(kIndentActionId, QStringLiteral("Indent"), index.row() > 0));
        actions.push_back(makeAction(kOutdentActionId, QStringLiteral("Outdent"), index.parent().isValid()));
        actions.push_back(ContextMenuAction::separatorAction());
        actions.push_back(makeAction(kDeleteActionId, QStringLiteral("Delete")));
    }

    m_contextMenu->setActions(actions);
    m_contextMenu->exec(event->globalPos());
    event->accept();
}

void ChecklistView::handleContextAction(const QString& id)
{
    const ItemId target = std::exchange(m_contextId, ItemId());
    if (!m_session)
        return;

    if (id == kAddRootActionId) {
        m_session->addRootItem();
        return;
    }
    if (target.isNull())
        return;

    if (id.startsWith(kSetStatePrefix)) {
        bool ok = false;
        const int number = id.mid(kSetStatePrefix.size()).toInt(&ok);
        if (ok)
            m_session->setItemStatus(target, number);
    } else if (id == kAddSiblingActionId) {
        m_session->addSiblingAfter(target);
    } else if (id == kAddChildActionId) {
        m_session->addChild(target);
    } else if (id == kIndentActionId) {
        if (m_session->indentItem(target))
            revealItem(target, false);
    } else if (id == kOutdentActionId) {
        m_session->outdentItem(target);
    } else if (id == kDeleteActionId) {
        m_session->removeItem(target);
    } else {
        qCWarning(checklisteditorlog).noquote() << "Unknown context action" << id;
    }
}

void ChecklistView::dragEnterEvent(QDragEnterEvent* event)
{
    if (ChecklistTreeModel::decodeMimeData(event->mimeData()).isNull()) {
        event->ignore();
        return;
    }
    event->acceptProposedAction();
}

void ChecklistView::dragMoveEvent(QDragMoveEvent* event)
{
    const ItemId source = ChecklistTreeModel::decodeMimeData(event->mimeData());
    m_dropTarget = source.isNull() ? std::nullopt : dropTargetAt(event->position().toPoint(), source);
    viewport()->update();

    if (!m_dropTarget) {
        event->ignore();
        return;
    }
    event->setDropAction(Qt::MoveAction);
    event->accept();
}

void ChecklistView::dragLeaveEvent(QDragLeaveEvent* event)
{
    clearDropIndicator();
    event->accept();
}

void ChecklistView::dropEvent(QDropEvent* event)
{
    const ItemId source = ChecklistTreeModel::decodeMimeData(event->mimeData());
    const std::optional<DropTarget> target =
        source.isNull() ? std::nullopt : dropTargetAt(event->position().toPoint(), source);
    clearDropIndicator();

    if (!m_session || !target) {
        event->ignore();
        return;
    }

    if (m_session->dropItem(source, target->targetId, target->zone))
        revealItem(source, false);
    event->setDropAction(Qt::MoveAction);
    event->accept();
}

void ChecklistView::paintEvent(QPaintEvent* event)
{
    QTreeView::paintEvent(event);
    if (!m_dropTarget)
        return;

    QRect rowRect = m_dropTarget->rowRect;
    if (m_dropTarget->zone == DropZone::End) {
        QModelIndex last = m_model->index(m_model->rowCount() - 1, 0);
        while (last.isValid() && isExpanded(last) && m_model->rowCount(last) > 0)
            last = m_model->index(m_model->rowCount(last) - 1, 0, last);
        if (!last.isValid())
            return;
        rowRect = visualRect(last);
    }

    QPainter painter(viewport());
    painter.setPen(QPen(palette().color(QPalette::Highlight), 2));
    painter.setBrush(Qt::NoBrush);
    switch (m_dropTarget->zone) {
        case DropZone::Before:
            painter.drawLine(rowRect.topLeft(), rowRect.topRight());
            break;
        case DropZone::After:
        case DropZone::End:
            painter.drawLine(rowRect.bottomLeft(), rowRect.bottomRight());
            break;
        case DropZone::Inside:
            painter.drawRect(rowRect.adjusted(1, 1, -2, -2));
            break;
    }
}

void ChecklistView::closeEditor(QWidget* editor, QAbstractItemDelegate::EndEditHint hint)
{
    const ItemId id = currentItemId();
    QTreeView::closeEditor(editor, QAbstractItemDelegate::NoHint);
    if (!m_session || id.isNull())
        return;

    // Tab, Shift+Tab and Enter keep their outline meaning while typing.
    switch (hint) {
        case QAbstractItemDelegate::EditNextItem:
            m_session->indentItem(id);
            revealItem(id, true);
            break;
        case QAbstractItemDelegate::EditPreviousItem:
            m_session->outdentItem(id);
            revealItem(id, true);
            break;
        case QAbstractItemDelegate::SubmitModelCache:
            m_session->addSiblingAfter(id);
            break;
        default:
            break;
    }
}

void ChecklistView::handleFocusRequested(const ItemId& id)
{
    revealItem(id, true);
}

void ChecklistView::handleExpansion(const QModelIndex& index, bool expanded)
{
    if (m_syncingExpansion || !m_session)
        return;
    const ItemId id = m_model->idForIndex(index);
    if (!id.isNull())
        m_session->setItemCollapsed(id, !expanded);
}

void ChecklistView::syncExpansion(const QModelIndex& parent)
{
    const QScopedValueRollback<bool> guard(m_syncingExpansion, true);
    const int rows = m_model->rowCount(parent);
    for (int row = 0; row < rows; ++row) {
        const QModelIndex child = m_model->index(row, 0, parent);
        if (m_model->rowCount(child) == 0)
            continue;
        setExpanded(child, !child.data(ChecklistTreeModel::CollapsedRole).toBool());
        syncExpansion(child);
    }
}

void ChecklistView::revealItem(const ItemId& id, bool startEditing)
{
    const QModelIndex index = m_model->indexForId(id);
    if (!index.isValid())
        return;

    for (QModelIndex p = index.parent(); p.isValid(); p = p.parent())
        expand(p);
    setCurrentIndex(index);
    scrollTo(index);
    if (startEditing)
        edit(index);
}

void ChecklistView::startItemDrag(const ItemId& id)
{
    const QModelIndex index = m_model->indexForId(id);
    QMimeData* mime = m_model->mimeData({ index });
    if (!mime)
        return;

    auto* drag = new QDrag(this);
    drag->setMimeData(mime);
    drag->setPixmap(viewport()->grab(visualRect(index)));
    qCDebug(checklisteditorlog).noquote() << "Drag started for" << id.toString();
    drag->exec(Qt::MoveAction);
    clearDropIndicator();
}

std::optional<ChecklistView::DropTarget> ChecklistView::dropTargetAt(const QPoint& pos, const ItemId& sourceId) const
{
    if (!m_session)
        return std::nullopt;

    DropTarget target;
    const QModelIndex index = indexAt(pos);
    if (!index.isValid()) {
        target.zone = DropZone::End;
        return target;
    }

    target.targetId = m_model->idForIndex(index);
    const ChecklistModel::Forest& items = m_session->checklist().items;
    if (target.targetId == sourceId || ChecklistModel::TreeEditor::isDescendant(items, sourceId, target.targetId))
        return std::nullopt;

    target.rowRect = visualRect(index);
    target.zone = DragTracker::zoneForPosition(pos.y(), target.rowRect.top(), target.rowRect.height());
    return target;
}

bool ChecklistView::indicatorHit(const QModelIndex& index, const QPoint& pos) const
{
    return ChecklistItemDelegate::indicatorRect(visualRect(index)).contains(pos);
}

void ChecklistView::clearDropIndicator()
{
    if (!m_dropTarget)
        return;
    m_dropTarget.reset();
    viewport()->update();
}

void ChecklistView::indentCurrent()
{
    const ItemId id = currentItemId();
    if (m_session && !id.isNull() && m_session->indentItem(id))
        revealItem(id, false);
}

void ChecklistView::outdentCurrent()
{
    const ItemId id = currentItemId();
    if (m_session && !id.isNull())
        m_session->outdentItem(id);
}

} // namespace ChecklistEditor
