// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/views/ChecklistItemDelegate.hpp"

#include "checklisteditor/ChecklistTreeModel.hpp"
#include "checklisteditor/views/IndicatorPainter.hpp"

#include <QtGui/QFontMetrics>
#include <QtGui/QPainter>
#include <QtWidgets/QApplication>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QStyle>

#include <algorithm>

namespace ChecklistEditor {

ChecklistItemDelegate::ChecklistItemDelegate(QObject* parent)
    : QStyledItemDelegate(parent)
{
}

QRect ChecklistItemDelegate::indicatorRect(const QRect& itemRect)
{
    const int top = itemRect.top() + (itemRect.height() - kIndicatorExtent) / 2;
    return QRect(itemRect.left() + kIndicatorMargin, top, kIndicatorExtent, kIndicatorExtent);
}

QRect ChecklistItemDelegate::textRect(const QRect& itemRect)
{
    const int left = itemRect.left() + kIndicatorMargin * 2 + kIndicatorExtent;
    return QRect(left, itemRect.top(), std::max(0, itemRect.right() - left - kIndicatorMargin), itemRect.height());
}

QSize ChecklistItemDelegate::sizeHint(const QStyleOptionViewItem& option, const QModelIndex& index) const
{
    QSize size = QStyledItemDelegate::sizeHint(option, index);
    size.setWidth(size.width() + kIndicatorExtent + kIndicatorMargin * 3);
    size.setHeight(std::max(size.height(), kMinimumRowHeight));
    return size;
}

void ChecklistItemDelegate::paint(QPainter* painter,
                                  const QStyleOptionViewItem& option,
                                  const QModelIndex& index) const
{
    if (!index.isValid()) {
        QStyledItemDelegate::paint(painter, option, index);
        return;
    }

    QStyleOptionViewItem opt = option;
    initStyleOption(&opt, index);
    QStyle* style = opt.widget ? opt.widget->style() : QApplication::style();

    const QColor stateColor(index.data(ChecklistTreeModel::ColorRole).toString());
    const QString symbol = index.data(ChecklistTreeModel::SymbolRole).toString();
    const bool selected = opt.state & QStyle::State_Selected;

    painter->save();
    if (!selected && stateColor.isValid())
        painter->fillRect(opt.rect, IndicatorPainter::blend(stateColor, opt.palette.color(QPalette::Base)));
    painter->restore();

    // Panel only; text and decoration are drawn below.
    opt.text.clear();
    opt.icon = QIcon();
    style->drawPrimitive(QStyle::PE_PanelItemViewItem, &opt, painter, opt.widget);

    IndicatorPainter::draw(painter, indicatorRect(opt.rect), symbol,
                           stateColor.isValid() ? stateColor : QColor(QStringLiteral("#888888")));

    const QRect textArea = textRect(opt.rect);
    const QString text = index.data(Qt::DisplayRole).toString();
    if (textArea.isEmpty() || text.isEmpty())
        return;

    painter->save();
    painter->setFont(opt.font);
    painter->setPen(opt.palette.color(selected ? QPalette::HighlightedText : QPalette::Text));
    const QString elided = QFontMetrics(opt.font).elidedText(text, Qt::ElideRight, textArea.width());
    painter->drawText(textArea, Qt::AlignVCenter | Qt::AlignLeft, elided);
    painter->restore();
}

QWidget* ChecklistItemDelegate::createEditor(QWidget* parent,
                                             const QStyleOptionViewItem& option,
                                             const QModelIndex& index) const
{
    QWidget* editor = QStyledItemDelegate::createEditor(parent, option, index);
    if (auto* line = qobject_cast<QLineEdit*>(editor))
        line->setFrame(false);
    return editor;
}

void ChecklistItemDelegate::updateEditorGeometry(QWidget* editor,
                                                 const QStyleOptionViewItem& option,
                                                 const QModelIndex& index) const
{
    Q_UNUSED(index);
    if (editor)
        editor->setGeometry(textRect(option.rect));
}

} // namespace ChecklistEditor
