/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/render/mask.hpp"
#include "badger/render/canvas.hpp"
#include "badger/logging.hpp"

#include <QPainter>

#include <algorithm>


using namespace badger;

namespace
{
    constexpr auto MASK_FORMAT = QImage::Format_Grayscale8;

    QImage blankMask(int size)
    {
        auto result = QImage(size, size, MASK_FORMAT);
        result.fill(0);

        return result;
    }

    int mixChannel(int d, int s, qreal t)
    {
        return qRound(d + (s - d) * t);
    }

    QRgb mixPixel(QRgb d, QRgb s, qreal t)
    {
        return qRgba(
            mixChannel(qRed(d),   qRed(s),   t),
            mixChannel(qGreen(d), qGreen(s), t),
            mixChannel(qBlue(d),  qBlue(s),  t),
            mixChannel(qAlpha(d), qAlpha(s), t));
    }
}

QImage render::roundedMask(int size, int cornerRadius)
{
    if (size <= 0 || cornerRadius < 0 || cornerRadius * 2 > size) {
        qCWarning(lcRender) << "invalid rounded mask" << size << "radius" << cornerRadius;
        return {};
    }

    auto result = blankMask(size);

    QPainter p(&result);
    p.setRenderHint(QPainter::Antialiasing);
    p.setPen(Qt::NoPen);
    p.setBrush(Qt::white);
    p.drawRoundedRect(QRectF(0, 0, size, size), cornerRadius, cornerRadius);

    return result;
}

QImage render::circleMask(int size)
{
    if (size <= 0) {
        qCWarning(lcRender) << "invalid circle mask" << size;
        return {};
    }

    auto result = blankMask(size);

    QPainter p(&result);
    p.setRenderHint(QPainter::Antialiasing);
    p.setPen(Qt::NoPen);
    p.setBrush(Qt::white);
    p.drawEllipse(QRectF(0, 0, size, size));

    return result;
}

bool render::compositeThroughMask(const QImage& source,
                                  const QImage& mask,
                                  QImage& dest,
                                  int originX,
                                  int originY,
                                  qreal opacity)
{
    if (source.isNull() || mask.isNull() || dest.isNull()) {
        qCWarning(lcRender) << "compositeThroughMask: null image";
        return false;
    }

    if (source.size() != mask.size()) {
        qCWarning(lcRender) << "compositeThroughMask: source" << source.size()
                            << "and mask" << mask.size() << "differ";
        return false;
    }

    if (const auto region = QRect(QPoint(originX, originY), source.size()); !dest.rect().contains(region)) {
        qCWarning(lcRender) << "compositeThroughMask:" << region << "exceeds" << dest.rect();
        return false;
    }

    const auto src = source.convertToFormat(CANVAS_FORMAT);
    const auto msk = mask.convertToFormat(MASK_FORMAT);
    const auto weight = std::clamp(opacity, 0.0, 1.0);

    if (dest.format() != CANVAS_FORMAT) {
        dest.convertTo(CANVAS_FORMAT);
    }

    for (int y = 0; y < src.height(); ++y) {
        const auto* s = reinterpret_cast<const QRgb*>(src.constScanLine(y));
        const auto* m = msk.constScanLine(y);
        auto* d = reinterpret_cast<QRgb*>(dest.scanLine(originY + y)) + originX;

        for (int x = 0; x < src.width(); ++x) {
            if (const auto t = m[x] / 255.0 * weight; t >= 1.0) {
                d[x] = s[x];
            } else if (t > 0.0) {
                d[x] = mixPixel(d[x], s[x], t);
            }
        }
    }

    return true;
}
