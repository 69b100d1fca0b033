/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QTemporaryDir>
#include <QTest>


class TestBatch final : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void jobs();
    void fullCatalog();
    void concurrentMatchesSequential();
    void skipsNonSquare();
    void renderFailureWritesNothing_data();
    void renderFailureWritesNothing();
    void writeFailure();
    void bleedExport();

private:
    QTemporaryDir _dir;
};
