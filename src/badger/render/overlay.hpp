/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QImage>


namespace badger::render
{
    struct IconDesign;

    /// 'size' square, transparent except for the translucent "glass" ellipse
    /// over its inner 80%.
    QImage highlightOverlay(int size, const IconDesign& design);

    /// Soft shadow ellipse on a canvas of shadowSize(size); larger than 'size'.
    QImage shadowLayer(int size, const IconDesign& design);

    /// Separable Gaussian blur with sigma == radius over all four channels.
    /// Pixels past the border are left out and the kernel renormalized.
    QImage gaussianBlur(const QImage& image, qreal radius);
}
