/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/core/BatchGenerator.hpp"
#include "badger/render/composer.hpp"
#include "badger/logging.hpp"

#include <QDir>
#include <QImageWriter>
#include <QThreadPool>
#include <QtConcurrent>

#include <algorithm>


using namespace badger;
using namespace badger::core;

namespace
{
    constexpr auto IMAGE_FORMAT = "png";
}


BatchGenerator::BatchGenerator(const render::IconDesign& design, QObject* parent)
    : QObject(parent)
    , _design(design)
{

}

void BatchGenerator::setJobs(int jobs)
{
    _jobs = std::max(1, jobs);
}

BatchReport BatchGenerator::generate(const QString& outputDir)
{
    constexpr auto entries = SizeCatalog::entries();

    return generate(outputDir, entries);
}

BatchReport BatchGenerator::generate(const QString& outputDir, std::span<const IconSizeSpec> entries)
{
    auto result = BatchReport{};

    QList<IconSizeSpec> specs;
    for (const auto& spec : entries) {
        if (spec.isSquare()) {
            specs << spec;
        } else {
            qCWarning(lcBatch) << "skipping non-square entry"
                               << spec.logicalWidth << "x" << spec.logicalHeight;
            result.skipped << spec;
        }
    }

    /// every render finishes before the first write.
    const auto images = renderAll(specs);

    if (const auto it = std::ranges::find_if(images, &QImage::isNull); it != images.end()) {
        const auto& spec = specs[std::distance(images.begin(), it)];
        qCCritical(lcBatch) << "failed to render" << spec.filename()
                            << "at" << spec.pixelSize() << "px, batch aborted";
        result.status = BatchStatus::RenderFailed;
        return result;
    }

    if (!QDir().mkpath(outputDir)) {
        qCWarning(lcBatch) << "failed to create" << outputDir;
    }

    const auto dir = QDir(outputDir);

    /// writes stay in catalog order so a repeated filename ends with the last entry.
    for (qsizetype i = 0; i < specs.size(); ++i) {
        const auto path = dir.filePath(specs[i].filename());

        if (auto error = QString(); writeIcon(images[i], path, &error)) {
            qCInfo(lcBatch) << "generated" << specs[i].filename()
                            << QString("(%1x%2)").arg(images[i].width()).arg(images[i].height());
            result.written << IconFile{path, images[i].width()};
            emit iconWritten(path, images[i].width());
        } else {
            qCWarning(lcBatch) << "failed to write" << path << error;
            result.errors << BatchItemError{path, error};
            emit iconFailed(path, error);
        }
    }

    if (!result.errors.isEmpty()) {
        result.status = BatchStatus::CompletedWithErrors;
    }

    return result;
}

QList<QImage> BatchGenerator::renderAll(const QList<IconSizeSpec>& specs) const
{
    const auto& design = _design;
    auto compose = [&design](const IconSizeSpec& spec)
    {
        return render::composeIcon(spec.pixelSize(), design);
    };

    if (_jobs <= 1) {
        QList<QImage> result;
        for (const auto& spec : specs) {
            result << compose(spec);
            if (result.back().isNull()) {
                break;
            }
        }
        return result;
    }

    QThreadPool pool;
    pool.setMaxThreadCount(_jobs);

    qCDebug(lcBatch) << "rendering" << specs.size() << "icons on" << _jobs << "threads";

    return QtConcurrent::blockingMapped<QList<QImage>>(&pool, specs, compose);
}

bool BatchGenerator::writeIcon(const QImage& image, const QString& path, QString* error) const
{
    QImageWriter writer(path, IMAGE_FORMAT);

    if (!writer.write(image)) {
        *error = writer.errorString();
        return false;
    }

    return true;
}
