/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/core/SizeCatalog.hpp"
#include "badger/render/design.hpp"


using namespace badger;
using namespace badger::core;

QLatin1StringView core::idiomName(Idiom idiom)
{
    switch (idiom) {
    case Idiom::IPhone:       return QLatin1StringView("iphone");
    case Idiom::IPad:         return QLatin1StringView("ipad");
    case Idiom::IOSMarketing: return QLatin1StringView("ios-marketing");
    }

    return {};
}

bool IconSizeSpec::isStoreIcon() const
{
    return qFuzzyCompare(logicalWidth, qreal(SizeCatalog::STORE_ICON_SIZE));
}

QString IconSizeSpec::filename() const
{
    if (isStoreIcon()) {
        return QString("AppIcon-%1.png").arg(SizeCatalog::STORE_ICON_SIZE);
    }

    const auto size = static_cast<int>(logicalWidth);

    if (scale > 1) {
        return QString("AppIcon-%1@%2x.png").arg(size).arg(scale);
    }

    return QString("AppIcon-%1.png").arg(size);
}

QStringList SizeCatalog::distinctFilenames()
{
    QStringList result;
    for (const auto& spec : entries()) {
        if (const auto name = spec.filename(); !result.contains(name)) {
            result << name;
        }
    }

    return result;
}

QHash<QString, int> SizeCatalog::expectedSizes(const render::IconDesign& design)
{
    QHash<QString, int> result;
    for (const auto& spec : entries()) {
        if (spec.isSquare()) {
            result.insert(spec.filename(), render::outputSize(spec.pixelSize(), design));
        }
    }

    return result;
}
