// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklisteditor/ChecklistEditorGlobal.hpp"

#include <QtWidgets/QStyledItemDelegate>

namespace ChecklistEditor {

class CHECKLISTEDITOR_EXPORT ChecklistItemDelegate final : public QStyledItemDelegate
{
    Q_OBJECT

public:
    static constexpr int kIndicatorExtent = 20;
    static constexpr int kIndicatorMargin = 4;
    static constexpr int kMinimumRowHeight = 28;

    explicit ChecklistItemDelegate(QObject* parent = nullptr);

    // Hit area of the status indicator inside an item's visual rect.
    static QRect indicatorRect(const QRect& itemRect);
    static QRect textRect(const QRect& itemRect);

    void paint(QPainter* painter, const QStyleOptionViewItem& option,
               const QModelIndex& index) const override;
    QSize sizeHint(const QStyleOptionViewItem& option, const QModelIndex& index) const override;

    QWidget* createEditor(QWidget* parent, const QStyleOptionViewItem& option,
                          const QModelIndex& index) const override;
    void updateEditorGeometry(QWidget* editor, const QStyleOptionViewItem& option,
                              const QModelIndex& index) const override;
};

} // namespace ChecklistEditor
