/// Copyright (C) 2025 Arlen Avakian
/// SPDX-License-Identifier: GPL-3.0-or-later

#include "badger/core/BatchGenerator.hpp"
#include "badger/core/IconValidator.hpp"
#include "badger/core/SizeCatalog.hpp"
#include "badger/render/design.hpp"
#include "badger/logging.hpp"
#include "badger/version.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

#include <print>


using namespace badger;

namespace
{
    constexpr auto DEFAULT_OUTPUT_DIR = "AppIcon.appiconset";

    enum ExitCode : int
    {
        EXIT_OK          = 0,
        EXIT_INVALID     = 1,
        EXIT_RENDER      = 2
    };

    void listCatalog(const render::IconDesign& design)
    {
        for (const auto& spec : core::SizeCatalog::entries()) {
            const auto size = render::outputSize(spec.pixelSize(), design);
            std::println("  {:<24} {:>6} x{}  {:>5} px  {}",
                spec.filename().toStdString(),
                spec.logicalWidth,
                spec.scale,
                size,
                core::idiomName(spec.idiom).toString().toStdString());
        }
    }

    /// prints one line per file and returns how many failed.
    qsizetype reportValidation(const QList<core::FileValidation>& checks)
    {
        qsizetype failed = 0;
        for (const auto& [path, result] : checks) {
            std::println("  {} {} - {}",
                result.valid ? "ok  " : "FAIL",
                QFileInfo(path).fileName().toStdString(),
                result.reason.toStdString());

            if (!result.valid) {
                ++failed;
            }
        }

        return failed;
    }
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName("badger");
    QCoreApplication::setApplicationVersion(version());

    QCommandLineParser parser;
    parser.setApplicationDescription("Renders and validates the app icon family.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("output-dir",
        QString("Directory the icons are written to (default: %1).").arg(QString(DEFAULT_OUTPUT_DIR)), "[output-dir]");

    const auto jobsOption = QCommandLineOption({"j", "jobs"}, "Render <n> icons concurrently.", "n", "1");
    const auto bleedOption = QCommandLineOption("bleed", "Keep the shadow margin instead of cropping to the icon size.");
    const auto scaleBlurOption = QCommandLineOption("scale-blur", "Scale the shadow blur radius with the icon size.");
    const auto strictOption = QCommandLineOption("strict", "Also check that every file has its catalog size.");
    const auto validateOnlyOption = QCommandLineOption("validate-only", "Validate the existing files, render nothing.");
    const auto listOption = QCommandLineOption("list", "Print the size catalog and exit.");
    const auto verboseOption = QCommandLineOption({"v", "verbose"}, "Print debug output.");

    parser.addOptions({jobsOption, bleedOption, scaleBlurOption, strictOption,
                       validateOnlyOption, listOption, verboseOption});
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        enableVerboseLogging();
    }

    auto ok = false;
    const auto jobs = parser.value(jobsOption).toInt(&ok);
    if (!ok || jobs < 1) {
        std::println(stderr, "badger: --jobs expects a positive number, got '{}'",
            parser.value(jobsOption).toStdString());
        return EXIT_RENDER;
    }

    auto design = render::IconDesign::standard();
    if (parser.isSet(bleedOption)) {
        design.exportMode = render::ExportMode::Bleed;
    }
    if (parser.isSet(scaleBlurOption)) {
        design.blurMode = render::BlurMode::Proportional;
    }

    if (parser.isSet(listOption)) {
        listCatalog(design);
        return EXIT_OK;
    }

    const auto args = parser.positionalArguments();
    const auto outputDir = args.isEmpty() ? QString(DEFAULT_OUTPUT_DIR) : args.first();

    std::println("{} {}",
        QCoreApplication::applicationName().toStdString(),
        QCoreApplication::applicationVersion().toStdString());

    auto status = EXIT_OK;

    if (!parser.isSet(validateOnlyOption)) {
        core::BatchGenerator generator(design);
        generator.setJobs(jobs);

        const auto report = generator.generate(outputDir);

        if (report.status == core::BatchStatus::RenderFailed) {
            std::println(stderr, "badger: rendering failed, nothing was written");
            return EXIT_RENDER;
        }

        for (const auto& [path, message] : report.errors) {
            std::println(stderr, "badger: {}: {}", path.toStdString(), message.toStdString());
        }

        std::println("{} icons written to {}", report.written.size(),
            QDir(outputDir).absolutePath().toStdString());

        if (!report.ok()) {
            status = EXIT_INVALID;
        }
    }

    core::IconValidator validator;
    if (parser.isSet(strictOption)) {
        validator.setExpectedSizes(core::SizeCatalog::expectedSizes(design));
    }

    const auto checks = validator.validateDirectory(outputDir);
    if (checks.isEmpty()) {
        std::println(stderr, "badger: no icons found in {}", outputDir.toStdString());
        return EXIT_INVALID;
    }

    if (reportValidation(checks) > 0) {
        status = EXIT_INVALID;
    }

    return status;
}
