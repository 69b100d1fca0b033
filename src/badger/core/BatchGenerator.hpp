/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "badger/core/SizeCatalog.hpp"
#include "badger/render/design.hpp"

#include <QImage>
#include <QList>
#include <QObject>

#include <span>


namespace badger::core
{
    struct IconFile
    {
        QString path;
        int pixelSize{0};
    };

    struct BatchItemError
    {
        QString path;
        QString message;
    };

    enum class BatchStatus
    {
        Completed,
        CompletedWithErrors,    ///< some files could not be written
        RenderFailed            ///< a render failed, nothing was written
    };

    struct BatchReport
    {
        BatchStatus status{BatchStatus::Completed};
        QList<IconFile> written;
        QList<BatchItemError> errors;
        QList<IconSizeSpec> skipped;

        bool ok() const { return status == BatchStatus::Completed; }
    };


    class BatchGenerator final : public QObject
    {
        Q_OBJECT

    public:
        explicit BatchGenerator(const render::IconDesign& design, QObject* parent = nullptr);

        /// number of icons rendered at the same time, 1 renders in place.
        void setJobs(int jobs);
        int jobs() const { return _jobs; }

        const render::IconDesign& design() const { return _design; }

        BatchReport generate(const QString& outputDir);
        BatchReport generate(const QString& outputDir, std::span<const IconSizeSpec> entries);

    signals:
        void iconWritten(const QString& path, int pixelSize);
        void iconFailed(const QString& path, const QString& message);

    private:
        QList<QImage> renderAll(const QList<IconSizeSpec>& specs) const;
        bool writeIcon(const QImage& image, const QString& path, QString* error) const;

        const render::IconDesign _design;
        int _jobs{1};
    };
}
