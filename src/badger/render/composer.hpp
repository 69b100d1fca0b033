/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "badger/render/design.hpp"

#include <QImage>


namespace badger::render
{
    /// Renders the badge at 'pixelSize'. The result is outputSize(pixelSize)
    /// square and depends on nothing but its arguments.
    /// Returns a null image if 'pixelSize' is not positive or a layer fails.
    QImage composeIcon(int pixelSize, const IconDesign& design);
}
