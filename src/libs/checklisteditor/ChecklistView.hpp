// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklisteditor/ChecklistEditorGlobal.hpp"
#include "checklisteditor/DragTracker.hpp"

#include <checklistmodel/ItemId.hpp>
#include <checklistmodel/TreeEditor.hpp>

#include <QtCore/QPointer>
#include <QtWidgets/QTreeView>

#include <optional>

namespace ChecklistModel {
class ChecklistSession;
}

namespace Utils {
class ContextMenu;
}

namespace ChecklistEditor {

class ChecklistTreeModel;
class ChecklistItemDelegate;

// Tree view over one session. All gestures are translated into session
// commands; the view never edits the forest directly.
class CHECKLISTEDITOR_EXPORT ChecklistView final : public QTreeView
{
    Q_OBJECT

public:
    explicit ChecklistView(ChecklistModel::ChecklistSession* session, QWidget* parent = nullptr);

    ChecklistTreeModel* checklistModel() const { return m_model; }
    ChecklistModel::ItemId currentItemId() const;
    void setMaxItemWidth(int width);

protected:
    bool event(QEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void contextMenuEvent(QContextMenuEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dragMoveEvent(QDragMoveEvent* event) override;
    void dragLeaveEvent(QDragLeaveEvent* event) override;
    void dropEvent(QDropEvent* event) override;
    void paintEvent(QPaintEvent* event) override;

protected slots:
    void closeEditor(QWidget* editor, QAbstractItemDelegate::EndEditHint hint) override;

private slots:
    void handleContextAction(const QString& id);
    void handleFocusRequested(const ChecklistModel::ItemId& id);
    void handleExpansion(const QModelIndex& index, bool expanded);

private:
    struct DropTarget final {
        ChecklistModel::ItemId targetId;
        ChecklistModel::DropZone zone = ChecklistModel::DropZone::End;
        QRect rowRect;
    };

    void syncExpansion(const QModelIndex& parent);
    void revealItem(const ChecklistModel::ItemId& id, bool startEditing);
    bool beginIndicatorPress(QMouseEvent* event);
    void startItemDrag(const ChecklistModel::ItemId& id);
    std::optional<DropTarget> dropTargetAt(const QPoint& pos, const ChecklistModel::ItemId& sourceId) const;
    bool indicatorHit(const QModelIndex& index, const QPoint& pos) const;
    void clearDropIndicator();

    void indentCurrent();
    void outdentCurrent();

    QPointer<ChecklistModel::ChecklistSession> m_session;
    ChecklistTreeModel* m_model = nullptr;
    ChecklistItemDelegate* m_delegate = nullptr;
    Utils::ContextMenu* m_contextMenu = nullptr;

    DragTracker m_dragTracker;
    ChecklistModel::ItemId m_pressedIndicator;
    ChecklistModel::ItemId m_contextId;
    ChecklistModel::ItemId m_restoreId;
    std::optional<DropTarget> m_dropTarget;
    bool m_syncingExpansion = false;
};

} // namespace ChecklistEditor
