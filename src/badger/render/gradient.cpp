/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/render/gradient.hpp"
#include "badger/render/canvas.hpp"
#include "badger/logging.hpp"

#include <algorithm>


using namespace badger;

namespace
{
    int mix(int a, int b, qreal ratio)
    {
        return static_cast<int>(a * (1.0 - ratio) + b * ratio);
    }
}

QImage render::renderGradient(int size, const QColor& colorA, const QColor& colorB)
{
    if (size <= 0) {
        qCWarning(lcRender) << "gradient size must be positive, got" << size;
        return {};
    }

    auto result = QImage(size, size, CANVAS_FORMAT);

    for (int y = 0; y < size; ++y) {
        const auto ratio = static_cast<qreal>(y) / size;
        const auto color = qRgb(
            mix(colorA.red(),   colorB.red(),   ratio),
            mix(colorA.green(), colorB.green(), ratio),
            mix(colorA.blue(),  colorB.blue(),  ratio));

        auto* line = reinterpret_cast<QRgb*>(result.scanLine(y));
        std::fill_n(line, size, color);
    }

    return result;
}
