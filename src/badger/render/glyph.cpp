/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/render/glyph.hpp"

#include <QImage>
#include <QPainter>


using namespace badger;

QPolygonF render::checkmarkPolygon(qreal x, qreal y, qreal size)
{
    return QPolygonF()
        << QPointF(x + size * 0.2, y + size * 0.5)
        << QPointF(x + size * 0.4, y + size * 0.7)
        << QPointF(x + size * 0.8, y + size * 0.3);
}

void render::fillPolygon(QImage& canvas, const QPolygonF& points, const QColor& color)
{
    if (canvas.isNull() || points.size() < 3) {
        return;
    }

    QPainter p(&canvas);
    p.setRenderHint(QPainter::Antialiasing);
    p.setPen(Qt::NoPen);
    p.setBrush(color);
    p.drawPolygon(points);
}
