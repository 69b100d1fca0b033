/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QHash>
#include <QList>
#include <QString>


namespace badger::core
{
    struct ValidationResult
    {
        bool valid{false};
        QString reason;
    };

    struct FileValidation
    {
        QString path;
        ValidationResult result;
    };


    class IconValidator final
    {
    public:
        static constexpr auto EXPECTED_FORMAT = "png";

        /// Enables the strict check: a file listed here must be exactly that wide.
        void setExpectedSizes(const QHash<QString, int>& sizes) { _expectedSizes = sizes; }
        bool isStrict() const { return !_expectedSizes.isEmpty(); }

        /// Checks, in order, that the icon is square, that a 1024 icon is at
        /// least 1024 wide, and that the file really is a PNG. Unreadable files
        /// come back invalid with the reader's message.
        ValidationResult isValid(const QString& path) const;

        /// isValid() for every *.png in 'dir', sorted by name.
        QList<FileValidation> validateDirectory(const QString& dir) const;

    private:
        QHash<QString, int> _expectedSizes;
    };
}
