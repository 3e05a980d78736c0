// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "checklisteditor/views/IndicatorPainter.hpp"

#include <checklistmodel/StateDefinition.hpp>

#include <QtCore/QPointF>
#include <QtGui/QPainter>
#include <QtGui/QPainterPath>
#include <QtGui/QPen>

#include <cmath>

namespace ChecklistEditor::IndicatorPainter {

namespace Symbols = ChecklistModel::Symbols;

namespace {

constexpr qreal kStroke = 1.8;
constexpr qreal kCorner = 3.0;
constexpr qreal kPi = 3.14159265358979323846;

QRectF boxFor(const QPointF& c, qreal size)
{
    const qreal s = size * 0.85;
    return QRectF(c.x() - s / 2, c.y() - s / 2, s, s);
}

QPen glyphPen(qreal width = kStroke)
{
    return QPen(QColor(Qt::white), width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
}

void fillBox(QPainter* p, const QRectF& box, const QColor& color)
{
    p->setPen(Qt::NoPen);
    p->setBrush(color);
    p->drawRoundedRect(box, kCorner, kCorner);
}

void drawStar(QPainter* p, const QPointF& c, const QColor& color, qreal size)
{
    const qreal outer = size * 0.42;
    const qreal inner = outer * 0.45;
    QPainterPath path;
    for (int i = 0; i < 10; ++i) {
        const qreal r = (i % 2 == 0) ? outer : inner;
        const qreal angle = kPi / 2 + i * kPi / 5;
        const QPointF pt(c.x() + r * std::cos(angle), c.y() - r * std::sin(angle));
        if (i == 0)
            path.moveTo(pt);
        else
            path.lineTo(pt);
    }
    path.closeSubpath();
    p->setPen(Qt::NoPen);
    p->setBrush(color);
    p->drawPath(path);
}

void drawText(QPainter* p, const QRectF& rect, const QColor& color, const QString& text,
              qreal pixelSize, bool bold)
{
    QFont font = p->font();
    font.setPixelSize(qMax(1, static_cast<int>(pixelSize)));
    font.setBold(bold);
    p->setFont(font);
    p->setPen(color);
    p->drawText(rect, Qt::AlignCenter, text);
}

} // namespace

void draw(QPainter* painter, const QRectF& rect, const QString& symbol, const QColor& color, qreal size)
{
    if (!painter || rect.isEmpty())
        return;

    painter->save();
    painter->setRenderHint(QPainter::Antialiasing);

    const QPointF c = rect.center();
    const QRectF box = boxFor(c, size);
    const qreal s = box.width();

    if (symbol == Symbols::kBullet) {
        const qreal r = size * 0.15;
        painter->setPen(Qt::NoPen);
        painter->setBrush(color);
        painter->drawEllipse(c, r, r);
    } else if (symbol == Symbols::kEmpty) {
        painter->setPen(QPen(color, kStroke));
        painter->setBrush(Qt::NoBrush);
        painter->drawRoundedRect(box, kCorner, kCorner);
    } else if (symbol == Symbols::kCheck) {
        fillBox(painter, box, color);
        QPainterPath tick;
        tick.moveTo(box.left() + s * 0.20, c.y());
        tick.lineTo(box.left() + s * 0.40, c.y() + s * 0.22);
        tick.lineTo(box.left() + s * 0.78, c.y() - s * 0.22);
        painter->setPen(glyphPen());
        painter->setBrush(Qt::NoBrush);
        painter->drawPath(tick);
    } else if (symbol == Symbols::kClock) {
        const qreal r = size * 0.38;
        painter->setPen(QPen(color, kStroke));
        painter->setBrush(Qt::NoBrush);
        painter->drawEllipse(c, r, r);
        painter->drawLine(c, QPointF(c.x(), c.y() - r * 0.55));
        painter->drawLine(c, QPointF(c.x() + r * 0.45, c.y()));
    } else if (symbol == Symbols::kMinus) {
        fillBox(painter, box, color);
        painter->setPen(glyphPen());
        painter->drawLine(QPointF(box.left() + s * 0.22, c.y()), QPointF(box.right() - s * 0.22, c.y()));
    } else if (symbol == Symbols::kSquare) {
        fillBox(painter, box, color);
    } else if (symbol == Symbols::kX) {
        fillBox(painter, box, color);
        const qreal m = s * 0.25;
        painter->setPen(glyphPen());
        painter->drawLine(QPointF(box.left() + m, box.top() + m), QPointF(box.right() - m, box.bottom() - m));
        painter->drawLine(QPointF(box.right() - m, box.top() + m), QPointF(box.left() + m, box.bottom() - m));
    } else if (symbol == Symbols::kStar) {
        drawStar(painter, c, color, size);
    } else if (symbol == Symbols::kExclaim) {
        fillBox(painter, box, color);
        painter->setPen(glyphPen(2.0));
        painter->drawLine(QPointF(c.x(), box.top() + s * 0.18), QPointF(c.x(), box.bottom() - s * 0.38));
        painter->drawPoint(QPointF(c.x(), box.bottom() - s * 0.20));
    } else if (symbol == Symbols::kQuestion) {
        const qreal r = size * 0.38;
        painter->setPen(QPen(color, kStroke));
        painter->setBrush(Qt::NoBrush);
        painter->drawEllipse(c, r, r);
        drawText(painter, rect, color, QStringLiteral("?"), size * 0.4, true);
    } else {
        drawText(painter, rect, color, symbol.left(2), size * 0.55, false);
    }

    painter->restore();
}

QColor blend(const QColor& color, const QColor& base, qreal alpha)
{
    const qreal a = qBound<qreal>(0.0, alpha, 1.0);
    return QColor::fromRgbF(color.redF() * a + base.redF() * (1 - a),
                            color.greenF() * a + base.greenF() * (1 - a),
                            color.blueF() * a + base.blueF() * (1 - a));
}

} // namespace ChecklistEditor::IndicatorPainter
