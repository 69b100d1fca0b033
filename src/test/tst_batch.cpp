/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "tst_batch.hpp"

#include "badger/core/BatchGenerator.hpp"
#include "badger/core/IconValidator.hpp"
#include "badger/core/SizeCatalog.hpp"
#include "badger/render/design.hpp"

#include <QDir>
#include <QFile>
#include <QImage>
#include <QSignalSpy>

#include <array>


using namespace badger;
using namespace badger::core;

void TestBatch::initTestCase()
{
    QVERIFY(_dir.isValid());
}

void TestBatch::jobs()
{
    BatchGenerator generator(render::IconDesign::standard());

    QCOMPARE(generator.jobs(), 1);

    generator.setJobs(4);
    QCOMPARE(generator.jobs(), 4);

    generator.setJobs(0);
    QCOMPARE(generator.jobs(), 1);

    generator.setJobs(-3);
    QCOMPARE(generator.jobs(), 1);
}

void TestBatch::fullCatalog()
{
    const auto outputDir = _dir.filePath("full/AppIcon.appiconset");

    BatchGenerator generator(render::IconDesign::standard());
    QSignalSpy written(&generator, &BatchGenerator::iconWritten);
    QSignalSpy failed(&generator, &BatchGenerator::iconFailed);

    const auto report = generator.generate(outputDir);

    QVERIFY(report.ok());
    QCOMPARE(report.written.size(), qsizetype(SizeCatalog::ENTRY_COUNT));
    QVERIFY(report.errors.isEmpty());
    QVERIFY(report.skipped.isEmpty());
    QCOMPARE(written.count(), SizeCatalog::ENTRY_COUNT);
    QCOMPARE(failed.count(), 0);

    const auto files = QDir(outputDir).entryList({"*.png"}, QDir::Files);
    QCOMPARE(files.size(), SizeCatalog::distinctFilenames().size());

    const auto store = QImage(QDir(outputDir).filePath("AppIcon-1024.png"));
    QCOMPARE(store.size(), QSize(1024, 1024));

    const auto ipadPro = QImage(QDir(outputDir).filePath("AppIcon-83@2x.png"));
    QCOMPARE(ipadPro.size(), QSize(167, 167));

    auto validator = IconValidator{};
    validator.setExpectedSizes(SizeCatalog::expectedSizes(generator.design()));

    const auto checks = validator.validateDirectory(outputDir);
    QCOMPARE(checks.size(), files.size());
    for (const auto& [path, result] : checks) {
        QVERIFY2(result.valid, qPrintable(path + ": " + result.reason));
    }
}

void TestBatch::concurrentMatchesSequential()
{
    constexpr auto entries = std::array{
        IconSizeSpec{ 20,   20,   2, Idiom::IPhone },
        IconSizeSpec{ 29,   29,   3, Idiom::IPhone },
        IconSizeSpec{ 60,   60,   2, Idiom::IPhone },
        IconSizeSpec{ 76,   76,   1, Idiom::IPad },
        IconSizeSpec{ 83.5, 83.5, 2, Idiom::IPad },
    };

    const auto sequentialDir = _dir.filePath("sequential");
    const auto concurrentDir = _dir.filePath("concurrent");

    BatchGenerator sequential(render::IconDesign::standard());
    BatchGenerator concurrent(render::IconDesign::standard());
    concurrent.setJobs(4);

    QVERIFY(sequential.generate(sequentialDir, entries).ok());
    QVERIFY(concurrent.generate(concurrentDir, entries).ok());

    for (const auto& spec : entries) {
        const auto a = QImage(QDir(sequentialDir).filePath(spec.filename()));
        const auto b = QImage(QDir(concurrentDir).filePath(spec.filename()));

        QVERIFY(!a.isNull());
        QCOMPARE(a, b);
    }
}

void TestBatch::skipsNonSquare()
{
    constexpr auto entries = std::array{
        IconSizeSpec{ 20, 20, 1, Idiom::IPhone },
        IconSizeSpec{ 20, 40, 2, Idiom::IPhone },
    };

    const auto outputDir = _dir.filePath("skip");

    BatchGenerator generator(render::IconDesign::standard());
    const auto report = generator.generate(outputDir, entries);

    QVERIFY(report.ok());
    QCOMPARE(report.written.size(), qsizetype(1));
    QCOMPARE(report.skipped.size(), qsizetype(1));
    QCOMPARE(report.skipped.first().logicalHeight, 40.0);
    QVERIFY(!QFile::exists(QDir(outputDir).filePath("AppIcon-20@2x.png")));
}

void TestBatch::renderFailureWritesNothing_data()
{
    QTest::addColumn<int>("jobs");

    QTest::newRow("sequential") << 1;
    QTest::newRow("concurrent") << 3;
}

void TestBatch::renderFailureWritesNothing()
{
    QFETCH(int, jobs);

    constexpr auto entries = std::array{
        IconSizeSpec{ 20, 20, 1, Idiom::IPhone },
        IconSizeSpec{ 0,  0,  1, Idiom::IPhone },
        IconSizeSpec{ 29, 29, 1, Idiom::IPhone },
    };

    const auto outputDir = _dir.filePath(QString("failed-%1").arg(jobs));

    BatchGenerator generator(render::IconDesign::standard());
    generator.setJobs(jobs);
    QSignalSpy written(&generator, &BatchGenerator::iconWritten);

    const auto report = generator.generate(outputDir, entries);

    QVERIFY(report.status == BatchStatus::RenderFailed);
    QVERIFY(report.written.isEmpty());
    QCOMPARE(written.count(), 0);
    QVERIFY(!QDir(outputDir).exists());
}

void TestBatch::writeFailure()
{
    /// a regular file where the output directory should go
    const auto blocker = _dir.filePath("blocker");
    {
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("x");
    }

    constexpr auto entries = std::array{
        IconSizeSpec{ 20, 20, 1, Idiom::IPhone },
        IconSizeSpec{ 20, 20, 2, Idiom::IPhone },
    };

    BatchGenerator generator(render::IconDesign::standard());
    QSignalSpy failed(&generator, &BatchGenerator::iconFailed);

    const auto report = generator.generate(QDir(blocker).filePath("icons"), entries);

    QVERIFY(report.status == BatchStatus::CompletedWithErrors);
    QVERIFY(!report.ok());
    QVERIFY(report.written.isEmpty());
    QCOMPARE(report.errors.size(), qsizetype(2));
    QCOMPARE(failed.count(), 2);
    QVERIFY(report.errors.first().path.endsWith("AppIcon-20.png"));
    QVERIFY(!report.errors.first().message.isEmpty());
}

void TestBatch::bleedExport()
{
    constexpr auto entries = std::array{
        IconSizeSpec{ 40, 40, 1, Idiom::IPhone },
    };

    auto design = render::IconDesign::standard();
    design.exportMode = render::ExportMode::Bleed;

    const auto outputDir = _dir.filePath("bleed");

    BatchGenerator generator(design);
    const auto report = generator.generate(outputDir, entries);

    QVERIFY(report.ok());
    QCOMPARE(report.written.first().pixelSize, 44);
    QCOMPARE(QImage(QDir(outputDir).filePath("AppIcon-40.png")).size(), QSize(44, 44));
}

QTEST_GUILESS_MAIN(TestBatch)
