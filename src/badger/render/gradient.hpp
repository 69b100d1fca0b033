/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QColor>
#include <QImage>


namespace badger::render
{
    /// Opaque 'size' x 'size' vertical gradient. Row 'y' is colorA and colorB
    /// mixed at y/size, each channel truncated; columns never vary.
    /// Returns a null image when 'size' is not positive.
    QImage renderGradient(int size, const QColor& colorA, const QColor& colorB);
}
