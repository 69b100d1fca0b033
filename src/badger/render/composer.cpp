/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/render/composer.hpp"
#include "badger/render/canvas.hpp"
#include "badger/render/glyph.hpp"
#include "badger/render/gradient.hpp"
#include "badger/render/mask.hpp"
#include "badger/render/overlay.hpp"
#include "badger/logging.hpp"


using namespace badger;
using namespace badger::render;

namespace
{
    /// the rounded-square badge: the background gradient clipped by the mask.
    QImage badge(int size, const IconDesign& design)
    {
        const auto background   = renderGradient(size, design.color(PRIMARY_BLUE), design.color(SECONDARY_BLUE));
        const auto cornerRadius = qRound(size * design.cornerRatio);
        const auto mask         = roundedMask(size, cornerRadius);

        auto result = createCanvas(size, size);
        if (!compositeThroughMask(background, mask, result, 0, 0)) {
            return {};
        }

        return result;
    }

    /// faint blue to purple disc; its opacity is the alpha of the palette colors.
    bool drawInnerCircle(QImage& icon, int size, const IconDesign& design)
    {
        const auto rec = centeredSquare(size, design.innerCircleRatio);
        if (rec.isEmpty()) {
            return true;
        }

        const auto side     = static_cast<int>(rec.width());
        const auto gradient = renderGradient(side, design.color(INNER_BLUE), design.color(ACCENT_PURPLE));
        const auto opacity  = design.color(INNER_BLUE).alphaF();

        return compositeThroughMask(gradient, circleMask(side), icon,
            static_cast<int>(rec.x()), static_cast<int>(rec.y()), opacity);
    }
}

QImage render::composeIcon(int pixelSize, const IconDesign& design)
{
    if (pixelSize <= 0) {
        qCWarning(lcRender) << "icon size must be positive, got" << pixelSize;
        return {};
    }

    auto icon = badge(pixelSize, design);
    if (icon.isNull()) {
        return {};
    }

    const auto& white = design.color(BACKGROUND_WHITE);

    fillEllipse(icon, centeredSquare(pixelSize, design.mainCircleRatio), white);

    if (!drawInnerCircle(icon, pixelSize, design)) {
        return {};
    }

    fillEllipse(icon, centeredSquare(pixelSize, design.badgeCircleRatio), white);

    const auto check = centeredSquare(pixelSize, design.checkmarkRatio);
    fillPolygon(icon, checkmarkPolygon(check.x(), check.y(), check.width()), design.color(PRIMARY_BLUE));

    alphaComposite(icon, highlightOverlay(pixelSize, design));

    auto result = shadowLayer(pixelSize, design);
    if (result.isNull()) {
        return {};
    }

    const auto offset = (result.width() - pixelSize) / 2;
    alphaComposite(result, icon, QPoint(offset, offset));

    qCDebug(lcRender) << "composed" << pixelSize << "on a" << result.size() << "shadow canvas";

    if (design.exportMode == ExportMode::Crop) {
        return centerCrop(result, pixelSize);
    }

    return result;
}
