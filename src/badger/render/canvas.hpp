/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QImage>
#include <QRectF>


class QColor;

namespace badger::render
{
    /// All canvases share this format; blending code relies on it.
    constexpr auto CANVAS_FORMAT = QImage::Format_ARGB32_Premultiplied;

    /// A fully transparent canvas, or a null image if either side is not positive.
    QImage createCanvas(int width, int height);

    /// The square of side 'ratio * size' centered in a 'size' square, with the
    /// offset and the side both truncated to whole pixels.
    QRectF centeredSquare(int size, qreal ratio);

    void fillEllipse(QImage& canvas, const QRectF& rec, const QColor& color);

    /// source-over of 'source' onto 'dest' with its top-left corner at 'origin'.
    void alphaComposite(QImage& dest, const QImage& source, const QPoint& origin = QPoint(0, 0));

    QImage centerCrop(const QImage& image, int size);
}
