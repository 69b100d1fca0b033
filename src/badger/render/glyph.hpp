/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QPolygonF>


class QColor;
class QImage;

namespace badger::render
{
    /// The simplified checkmark inside the 'size' box at (x, y): a stroke from
    /// (0.2, 0.5) down to (0.4, 0.7) and up to (0.8, 0.3), in box fractions.
    QPolygonF checkmarkPolygon(qreal x, qreal y, qreal size);

    void fillPolygon(QImage& canvas, const QPolygonF& points, const QColor& color);
}
