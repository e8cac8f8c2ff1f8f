// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <iostream>
#include <string>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QSettings>
#include <KAboutData>
#include "ChartViewState.h"
#include "ScannerManager.h"
#include "Settings.h"
#include "Utils.h"
#include "Version.h"

namespace {
    enum ExitCode {
        ExitOk = 0,
        ExitUsage = 1,
        ExitScanFailed = 2,
        ExitTrashFailed = 3,
        ExitPathNotInTree = 4
    };

    QString absolutePath(const QString& path) {
        return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    }

    // Runs one scan to completion, printing progress on stderr.
    // Returns false if the scan failed or was cancelled.
    bool runScan(ScannerManager& manager, const QString& path, bool rescan) {
        QEventLoop loop;
        bool failed = false;

        QObject::connect(&manager, &ScannerManager::progressChanged, &loop, [](double fraction, const QString& itemName) {
            std::cerr << "\rScanning... " << static_cast<int>(fraction * 100.0) << "% "
                      << itemName.left(60).toStdString() << "\x1b[K";
            std::cerr.flush();
        });
        QObject::connect(&manager, &ScannerManager::errorMessage, &loop, [&failed](const QString& title, const QString& message) {
            failed = true;
            std::cerr << "\n" << title.toStdString() << ": " << message.toStdString() << "\n";
        });
        QObject::connect(&manager, &ScannerManager::scanCancelled, &loop, [&failed]() {
            failed = true;
        });
        QObject::connect(&manager, &ScannerManager::scannerFinished, &loop, &QEventLoop::quit);

        if (rescan) {
            manager.rescan();
        } else {
            manager.startScan(path);
        }
        loop.exec();

        std::cerr << "\n";
        return !failed && manager.rootNode();
    }

    void printEntry(const FileSystemEntry& entry, const QString& indent) {
        std::cout << indent.toStdString()
                  << Utils::formatByteSize(entry.sizeBytes).rightJustified(11).toStdString() << "  "
                  << Utils::formatPercentage(entry.percentageOfTotal).rightJustified(6).toStdString() << "  "
                  << Utils::entryKind(entry).leftJustified(10).toStdString() << " "
                  << entry.name << "\n";
    }

    void printSummary(const ChartViewState& view, int top) {
        const FileSystemEntry* focus = view.currentNode();
        if (!focus) {
            return;
        }

        std::cout << focus->path << "\n";
        printEntry(*focus, QString());

        if (!focus->children) {
            return;
        }

        std::cout << "\n" << focus->childCount() << " items\n";
        int shown = 0;
        for (const auto& child : *focus->children) {
            if (shown++ == top) {
                std::cout << "  ... " << (focus->childCount() - static_cast<size_t>(top)) << " more\n";
                break;
            }
            printEntry(child, QStringLiteral("  "));
        }
    }

    void printRings(const std::vector<LayoutEngine::Ring>& rings, int top) {
        for (size_t i = 0; i < rings.size(); ++i) {
            const auto& ring = rings[i];
            std::cout << "\nRing " << i << " (" << ring.size() << " slices)\n";

            int shown = 0;
            for (const auto& slice : ring) {
                if (shown++ == top) {
                    std::cout << "  ... " << (ring.size() - static_cast<size_t>(top)) << " more\n";
                    break;
                }
                std::cout << "  ["
                          << QString::number(slice.startAngleDeg, 'f', 2).rightJustified(8).toStdString() << ", "
                          << QString::number(slice.endAngleDeg, 'f', 2).rightJustified(8).toStdString() << ")  color "
                          << slice.colorIndex << "  alpha " << QString::number(slice.opacity, 'f', 2).toStdString()
                          << "  " << slice.node->name << "\n";
            }
        }
    }

    // Parses "AxB" or "A,B" into two doubles.
    bool parsePair(const QString& text, QChar separator, double& a, double& b) {
        const QStringList parts = text.split(separator);
        if (parts.size() != 2) {
            return false;
        }
        bool okA = false;
        bool okB = false;
        a = parts[0].trimmed().toDouble(&okA);
        b = parts[1].trimmed().toDouble(&okB);
        return okA && okB;
    }
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("ringdu"));

    KAboutData aboutData(
        QStringLiteral("ringdu"),
        QStringLiteral("RingDu"),
        QString::fromUtf8(Version::VERSION.data(), static_cast<qsizetype>(Version::VERSION.size())),
        QStringLiteral("Measures a directory tree and lays it out as a sunburst chart."),
        KAboutLicense::GPL_V3,
        QStringLiteral("(c) 2026 Reikooters")
    );
    aboutData.addAuthor(QStringLiteral("Reikooters"), QStringLiteral("Developer"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption logicalOpt(QStringLiteral("logical-sizes"), QStringLiteral("Count file lengths instead of allocated disk space."));
    const QCommandLineOption oneFsOpt(QStringLiteral("one-file-system"), QStringLiteral("Do not descend into other filesystems."));
    const QCommandLineOption baseDepthOpt(QStringLiteral("base-depth"), QStringLiteral("Rings shown without expanding."), QStringLiteral("n"));
    const QCommandLineOption focusOpt(QStringLiteral("focus"), QStringLiteral("Put this directory at the center of the chart."), QStringLiteral("path"));
    const QCommandLineOption expandOpt(QStringLiteral("expand"), QStringLiteral("Expand this directory past the base depth (repeatable)."), QStringLiteral("path"));
    const QCommandLineOption hitOpt(QStringLiteral("hit"), QStringLiteral("Report the entry under canvas point x,y."), QStringLiteral("x,y"));
    const QCommandLineOption canvasOpt(QStringLiteral("canvas"), QStringLiteral("Canvas size used by --hit."), QStringLiteral("WxH"), QStringLiteral("800x800"));
    const QCommandLineOption trashOpt(QStringLiteral("trash"), QStringLiteral("Move this entry to the trash, then scan again."), QStringLiteral("path"));
    const QCommandLineOption topOpt(QStringLiteral("top"), QStringLiteral("Entries listed per section."), QStringLiteral("n"), QStringLiteral("10"));
    const QCommandLineOption saveOpt(QStringLiteral("save-settings"), QStringLiteral("Store the effective scan and chart options as defaults."));

    parser.addOptions({logicalOpt, oneFsOpt, baseDepthOpt, focusOpt, expandOpt, hitOpt, canvasOpt, trashOpt, topOpt, saveOpt});
    parser.addPositionalArgument(QStringLiteral("path"), QStringLiteral("Directory to measure."));

    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        std::cerr << parser.helpText().toStdString();
        return ExitUsage;
    }

    QSettings settings;
    DirectoryScannerEngine::ScanOptions scanOptions = Settings::loadScanOptions(settings);
    LayoutEngine::LayoutOptions layoutOptions = Settings::loadLayoutOptions(settings);

    if (parser.isSet(logicalOpt)) {
        scanOptions.sizeMode = DirectoryScannerEngine::SizeMode::Logical;
    }
    if (parser.isSet(oneFsOpt)) {
        scanOptions.stayOnFilesystem = true;
    }
    if (parser.isSet(baseDepthOpt)) {
        bool ok = false;
        layoutOptions.baseDepth = parser.value(baseDepthOpt).toInt(&ok);
        if (!ok) {
            std::cerr << "Error: --base-depth expects a number.\n";
            return ExitUsage;
        }
        Settings::clampLayoutOptions(layoutOptions);
    }

    bool topOk = false;
    const int top = parser.value(topOpt).toInt(&topOk);
    if (!topOk || top < 0) {
        std::cerr << "Error: --top expects a non-negative number.\n";
        return ExitUsage;
    }

    if (parser.isSet(saveOpt)) {
        Settings::saveScanOptions(settings, scanOptions);
        Settings::saveLayoutOptions(settings, layoutOptions);
        qInfo() << "Saved settings to" << settings.fileName();
    }

    ScannerManager manager;
    manager.setScanOptions(scanOptions);

    const QString rootPath = absolutePath(positional.first());
    if (!runScan(manager, rootPath, false)) {
        return ExitScanFailed;
    }

    ChartViewState view(layoutOptions);
    view.setRoot(manager.rootNode());

    if (parser.isSet(trashOpt)) {
        const QString target = absolutePath(parser.value(trashOpt));
        const FileSystemEntry* entry = view.findByPath(target.toStdString());
        if (!entry) {
            std::cerr << "Error: " << target.toStdString() << " is not part of the scanned tree.\n";
            return ExitPathNotInTree;
        }

        QString trashError;
        QObject::connect(&manager, &ScannerManager::errorMessage, [&trashError](const QString&, const QString& message) {
            trashError = message;
        });

        if (!manager.moveToTrash(*entry)) {
            std::cerr << trashError.toStdString() << "\n";
            return ExitTrashFailed;
        }

        // The old tree still shows the trashed entry; measure again
        if (!runScan(manager, rootPath, true)) {
            return ExitScanFailed;
        }
        view.setRoot(manager.rootNode());
    }

    if (parser.isSet(focusOpt)) {
        const QString target = absolutePath(parser.value(focusOpt));
        const FileSystemEntry* entry = view.findByPath(target.toStdString());
        if (!entry || !view.drillDown(*entry)) {
            std::cerr << "Error: " << target.toStdString() << " is not a non-empty directory in the scanned tree.\n";
            return ExitPathNotInTree;
        }
    }

    // Expansion is scoped to the focus, so it has to come after --focus
    for (const QString& value : parser.values(expandOpt)) {
        const QString target = absolutePath(value);
        const FileSystemEntry* entry = view.findByPath(target.toStdString());
        if (!entry) {
            std::cerr << "Error: " << target.toStdString() << " is not part of the scanned tree.\n";
            return ExitPathNotInTree;
        }
        view.expand(*entry);
    }

    printSummary(view, top);
    printRings(view.rings(), top);

    if (parser.isSet(hitOpt)) {
        double x = 0, y = 0, width = 0, height = 0;
        if (!parsePair(parser.value(hitOpt), QLatin1Char(','), x, y)
            || !parsePair(parser.value(canvasOpt), QLatin1Char('x'), width, height)) {
            std::cerr << "Error: --hit expects x,y and --canvas expects WxH.\n";
            return ExitUsage;
        }

        std::cout << "\nHit (" << x << ", " << y << "): ";
        if (const FileSystemEntry* hit = view.nodeAt(x, y, width, height)) {
            std::cout << hit->path << "\n";
            printEntry(*hit, QStringLiteral("  "));
        } else {
            std::cout << "nothing\n";
        }
    }

    return ExitOk;
}
