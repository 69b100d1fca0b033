/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QColor>

#include <array>


namespace badger::render
{
    enum PaletteIndex
    {
        PRIMARY_BLUE = 0,
        SECONDARY_BLUE,

        INNER_BLUE,
        ACCENT_PURPLE,

        BACKGROUND_WHITE,
        SHADOW_GRAY,
        HIGHLIGHT_WHITE,

        PaletteIndexSize
    };

    using Palette = std::array<QColor, PaletteIndexSize>;

    /// What happens to the shadow margin when the icon is exported.
    enum class ExportMode
    {
        Crop,   ///< center-crop back to the requested pixel size
        Bleed   ///< keep the whole shadow canvas
    };

    enum class BlurMode
    {
        Fixed,          ///< the same radius at every size
        Proportional    ///< radius scaled by size / BLUR_REFERENCE_SIZE
    };

    /// The fixed composition of the badge. Built once, never mutated, and
    /// handed to every renderer by const reference.
    struct IconDesign
    {
        static constexpr auto BLUR_REFERENCE_SIZE = 1024;

        static constexpr Palette factory()
        {
            Palette result;

            result[PRIMARY_BLUE]     = {   0, 122, 255, 255 };
            result[SECONDARY_BLUE]   = {   0,  89, 204, 255 };
            result[INNER_BLUE]       = {   0, 122, 255,  25 };
            result[ACCENT_PURPLE]    = { 128,   0, 255,  25 };
            result[BACKGROUND_WHITE] = { 255, 255, 255, 255 };
            result[SHADOW_GRAY]      = {   0,   0,   0,  25 };
            result[HIGHLIGHT_WHITE]  = { 255, 255, 255,  77 };

            return result;
        }

        static constexpr IconDesign standard()
        {
            return IconDesign{ .palette = factory() };
        }

        const QColor& color(PaletteIndex index) const { return palette[index]; }

        Palette palette;

        qreal cornerRatio{0.22};
        qreal mainCircleRatio{0.6};
        qreal innerCircleRatio{0.4};
        qreal badgeCircleRatio{0.3};
        qreal checkmarkRatio{0.25};

        qreal highlightInset{0.1};
        qreal highlightRatio{0.8};

        qreal shadowRatio{1.1};
        qreal blurRadius{2.0};

        ExportMode exportMode{ExportMode::Crop};
        BlurMode blurMode{BlurMode::Fixed};
    };

    /// side of the shadow canvas for an icon of 'pixelSize'.
    inline int shadowSize(int pixelSize, const IconDesign& design)
    {
        return static_cast<int>(pixelSize * design.shadowRatio);
    }

    /// blur radius used for the shadow of an icon of 'pixelSize'.
    inline qreal blurRadius(int pixelSize, const IconDesign& design)
    {
        if (design.blurMode == BlurMode::Proportional) {
            return design.blurRadius * pixelSize / IconDesign::BLUR_REFERENCE_SIZE;
        }
        return design.blurRadius;
    }

    /// width and height of the image composeIcon() returns for 'pixelSize'.
    inline int outputSize(int pixelSize, const IconDesign& design)
    {
        if (design.exportMode == ExportMode::Bleed) {
            return shadowSize(pixelSize, design);
        }
        return pixelSize;
    }
}
