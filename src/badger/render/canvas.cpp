/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/render/canvas.hpp"
#include "badger/logging.hpp"

#include <QPainter>


using namespace badger;

QImage render::createCanvas(int width, int height)
{
    if (width <= 0 || height <= 0) {
        qCWarning(lcRender) << "invalid canvas size" << width << "x" << height;
        return {};
    }

    auto result = QImage(width, height, CANVAS_FORMAT);
    result.fill(Qt::transparent);

    return result;
}

QRectF render::centeredSquare(int size, qreal ratio)
{
    const auto side   = static_cast<int>(size * ratio);
    const auto offset = (size - side) / 2;

    return QRectF(offset, offset, side, side);
}

void render::fillEllipse(QImage& canvas, const QRectF& rec, const QColor& color)
{
    if (canvas.isNull() || rec.isEmpty()) {
        return;
    }

    QPainter p(&canvas);
    p.setRenderHint(QPainter::Antialiasing);
    p.setPen(Qt::NoPen);
    p.setBrush(color);
    p.drawEllipse(rec);
}

void render::alphaComposite(QImage& dest, const QImage& source, const QPoint& origin)
{
    if (dest.isNull() || source.isNull()) {
        return;
    }

    QPainter p(&dest);
    p.setCompositionMode(QPainter::CompositionMode_SourceOver);
    p.drawImage(origin, source);
}

QImage render::centerCrop(const QImage& image, int size)
{
    if (image.width() == size && image.height() == size) {
        return image;
    }

    const auto x = (image.width()  - size) / 2;
    const auto y = (image.height() - size) / 2;

    return image.copy(x, y, size, size);
}
