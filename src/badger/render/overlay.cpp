/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/render/overlay.hpp"
#include "badger/render/canvas.hpp"
#include "badger/render/design.hpp"
#include "badger/logging.hpp"

#include <algorithm>
#include <cmath>
#include <vector>


using namespace badger;

namespace
{
    constexpr auto CHANNELS = 4;

    std::vector<float> gaussianKernel(qreal sigma)
    {
        const auto half = static_cast<int>(std::ceil(sigma * 3.0));

        auto result = std::vector<float>(half * 2 + 1);
        for (int k = -half; k <= half; ++k) {
            result[k + half] = static_cast<float>(std::exp(-(k * k) / (2.0 * sigma * sigma)));
        }

        return result;
    }

    /// one blur pass along the rows or the columns of a w*h*4 buffer.
    std::vector<float> blurPass(const std::vector<float>& src, int w, int h, const std::vector<float>& kernel, bool horizontal)
    {
        const auto half = static_cast<int>(kernel.size() / 2);
        const auto len  = horizontal ? w : h;

        auto result = std::vector<float>(src.size(), 0.0f);

        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                const auto pos = horizontal ? x : y;

                float acc[CHANNELS] = {};
                float weightSum = 0.0f;

                for (int k = -half; k <= half; ++k) {
                    const auto i = pos + k;
                    if (i < 0 || i >= len) {
                        continue;
                    }

                    const auto sx = horizontal ? i : x;
                    const auto sy = horizontal ? y : i;
                    const auto* px = &src[(sy * w + sx) * CHANNELS];
                    const auto weight = kernel[k + half];

                    for (int c = 0; c < CHANNELS; ++c) {
                        acc[c] += px[c] * weight;
                    }
                    weightSum += weight;
                }

                auto* out = &result[(y * w + x) * CHANNELS];
                for (int c = 0; c < CHANNELS; ++c) {
                    out[c] = weightSum > 0.0f ? acc[c] / weightSum : 0.0f;
                }
            }
        }

        return result;
    }

    int toChannel(float v)
    {
        return std::clamp(static_cast<int>(std::lround(v)), 0, 255);
    }
}

QImage render::highlightOverlay(int size, const IconDesign& design)
{
    auto result = createCanvas(size, size);

    const auto side  = static_cast<int>(size * design.highlightRatio);
    const auto inset = static_cast<int>(size * design.highlightInset);

    fillEllipse(result, QRectF(inset, inset, side, side), design.color(HIGHLIGHT_WHITE));

    return result;
}

QImage render::shadowLayer(int size, const IconDesign& design)
{
    if (size <= 0) {
        qCWarning(lcRender) << "shadow size must be positive, got" << size;
        return {};
    }

    const auto side = shadowSize(size, design);
    auto result = createCanvas(side, side);
    fillEllipse(result, QRectF(0, 0, side, side), design.color(SHADOW_GRAY));

    return gaussianBlur(result, blurRadius(size, design));
}

QImage render::gaussianBlur(const QImage& image, qreal radius)
{
    if (image.isNull() || radius <= 0.0) {
        return image;
    }

    const auto src = image.convertToFormat(CANVAS_FORMAT);
    const auto w   = src.width();
    const auto h   = src.height();

    auto buffer = std::vector<float>(static_cast<size_t>(w) * h * CHANNELS);
    for (int y = 0; y < h; ++y) {
        const auto* line = reinterpret_cast<const QRgb*>(src.constScanLine(y));
        for (int x = 0; x < w; ++x) {
            auto* px = &buffer[(y * w + x) * CHANNELS];
            px[0] = qRed(line[x]);
            px[1] = qGreen(line[x]);
            px[2] = qBlue(line[x]);
            px[3] = qAlpha(line[x]);
        }
    }

    const auto kernel = gaussianKernel(radius);
    const auto blurred = blurPass(blurPass(buffer, w, h, kernel, true), w, h, kernel, false);

    auto result = QImage(w, h, CANVAS_FORMAT);
    for (int y = 0; y < h; ++y) {
        auto* line = reinterpret_cast<QRgb*>(result.scanLine(y));
        for (int x = 0; x < w; ++x) {
            const auto* px = &blurred[(y * w + x) * CHANNELS];
            const auto a = toChannel(px[3]);

            /// keep the premultiplied invariant after rounding.
            line[x] = qRgba(
                std::min(toChannel(px[0]), a),
                std::min(toChannel(px[1]), a),
                std::min(toChannel(px[2]), a),
                a);
        }
    }

    qCDebug(lcRender) << "blurred" << image.size() << "radius" << radius;

    return result;
}
