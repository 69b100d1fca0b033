/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include <array>


namespace badger::render
{
    struct IconDesign;
}

namespace badger::core
{
    enum class Idiom
    {
        IPhone,
        IPad,
        IOSMarketing
    };

    QLatin1StringView idiomName(Idiom idiom);

    struct IconSizeSpec
    {
        qreal logicalWidth;
        qreal logicalHeight;
        int scale;
        Idiom idiom;

        bool isSquare() const { return qFuzzyCompare(logicalWidth, logicalHeight); }
        bool isStoreIcon() const;

        /// actual pixel width of the rendered icon.
        int pixelSize() const { return qRound(logicalWidth * scale); }

        /// AppIcon-{size}.png or AppIcon-{size}@{scale}x.png, with the logical
        /// size truncated. Every store entry is AppIcon-1024.png.
        QString filename() const;
    };

    class SizeCatalog final
    {
    public:
        static constexpr auto STORE_ICON_SIZE = 1024;
        static constexpr auto ENTRY_COUNT = 16;

        using Entries = std::array<IconSizeSpec, ENTRY_COUNT>;

        static constexpr Entries entries()
        {
            return {{
                { 20,   20,   1, Idiom::IPhone },
                { 20,   20,   2, Idiom::IPhone },
                { 20,   20,   3, Idiom::IPhone },
                { 29,   29,   1, Idiom::IPhone },
                { 29,   29,   2, Idiom::IPhone },
                { 29,   29,   3, Idiom::IPhone },
                { 40,   40,   1, Idiom::IPhone },
                { 40,   40,   2, Idiom::IPhone },
                { 40,   40,   3, Idiom::IPhone },
                { 60,   60,   1, Idiom::IPhone },
                { 60,   60,   2, Idiom::IPhone },
                { 60,   60,   3, Idiom::IPhone },
                { 76,   76,   1, Idiom::IPad },
                { 76,   76,   2, Idiom::IPad },
                { 83.5, 83.5, 2, Idiom::IPad },
                { 1024, 1024, 1, Idiom::IOSMarketing },
            }};
        }

        /// filenames in first-appearance order, each once.
        static QStringList distinctFilenames();

        /// width every file should have once written with 'design'. When two
        /// entries share a filename the later one wins, as it does on disk.
        static QHash<QString, int> expectedSizes(const render::IconDesign& design);
    };
}
