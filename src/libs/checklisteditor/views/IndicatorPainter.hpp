// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "checklisteditor/ChecklistEditorGlobal.hpp"

#include <QtCore/QRectF>
#include <QtGui/QColor>
#include <QtCore/QString>

class QPainter;

namespace ChecklistEditor::IndicatorPainter {

inline constexpr qreal kDefaultSize = 16.0;

// Paints a palette symbol centred in rect. Unknown tags are drawn as their
// first two characters.
CHECKLISTEDITOR_EXPORT void draw(QPainter* painter, const QRectF& rect, const QString& symbol,
                                 const QColor& color, qreal size = kDefaultSize);

// Tint used behind a row: the state color at low opacity over base.
CHECKLISTEDITOR_EXPORT QColor blend(const QColor& color, const QColor& base, qreal alpha = 0.10);

} // namespace ChecklistEditor::IndicatorPainter
