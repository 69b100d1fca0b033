/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/core/IconValidator.hpp"
#include "badger/core/SizeCatalog.hpp"
#include "badger/logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QImageReader>


using namespace badger::core;

namespace
{
    ValidationResult invalid(const QString& reason)
    {
        return {false, reason};
    }
}

ValidationResult IconValidator::isValid(const QString& path) const
{
    QImageReader reader(path);
    reader.setDecideFormatFromContent(true);

    const auto format = reader.format();
    const auto image  = reader.read();

    if (image.isNull()) {
        qCDebug(lcValidate) << path << reader.errorString();
        return invalid(QString("Error validating icon: %1").arg(reader.errorString()));
    }

    const auto name = QFileInfo(path).fileName();

    if (image.width() != image.height()) {
        return invalid("Icon must be square");
    }

    const auto storeIcon = name.contains(QString::number(SizeCatalog::STORE_ICON_SIZE));

    if (storeIcon && image.width() < SizeCatalog::STORE_ICON_SIZE) {
        return invalid("App Store icon must be at least 1024x1024");
    }

    if (format != EXPECTED_FORMAT) {
        return invalid("Icon must be PNG format");
    }

    if (const auto it = _expectedSizes.constFind(name); it != _expectedSizes.cend() && image.width() != *it) {
        return invalid(QString("Icon size does not match the catalog (%1 instead of %2)")
            .arg(image.width())
            .arg(*it));
    }

    return {true, "Icon is valid"};
}

QList<FileValidation> IconValidator::validateDirectory(const QString& path) const
{
    const auto dir   = QDir(path);
    const auto files = dir.entryList({"*.png"}, QDir::Files, QDir::Name);

    QList<FileValidation> result;
    for (const auto& file : files) {
        const auto filePath = dir.filePath(file);
        const auto check    = isValid(filePath);

        if (!check.valid) {
            qCWarning(lcValidate) << file << check.reason;
        }
        result << FileValidation{filePath, check};
    }

    return result;
}
