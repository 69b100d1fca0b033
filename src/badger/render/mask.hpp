/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QImage>


namespace badger::render
{
    /// Grayscale8 mask of a 'size' square: 255 inside a rounded rectangle with
    /// 'cornerRadius' corners, 0 outside, antialiased in between.
    /// Null if 'size' <= 0 or the radius is outside [0, size/2].
    QImage roundedMask(int size, int cornerRadius);

    /// Grayscale8 mask of the circle inscribed in a 'size' square.
    QImage circleMask(int size);

    /// Pastes 'source' into 'dest' at (originX, originY), weighting each pixel
    /// by mask/255 * opacity: 0 keeps dest, 1 takes source, anything between is
    /// a linear mix of the premultiplied channels.
    ///
    /// 'source' and 'mask' must have the same size and the pasted region must
    /// lie inside 'dest'. Otherwise nothing is drawn and false is returned.
    bool compositeThroughMask(const QImage& source,
                              const QImage& mask,
                              QImage& dest,
                              int originX,
                              int originY,
                              qreal opacity = 1.0);
}
