// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <QSettings>
#include <QStringList>
#include "Settings.h"

namespace Settings {

    DirectoryScannerEngine::ScanOptions loadScanOptions(QSettings& s) {
        DirectoryScannerEngine::ScanOptions options;

        s.beginGroup(QStringLiteral("scan"));

        const bool logical = s.value(QStringLiteral("useLogicalSizes"), false).toBool();
        options.sizeMode = logical ? DirectoryScannerEngine::SizeMode::Logical
                                   : DirectoryScannerEngine::SizeMode::Allocated;

        options.stayOnFilesystem = s.value(QStringLiteral("stayOnFilesystem"), false).toBool();

        if (s.contains(QStringLiteral("packageSuffixes"))) {
            options.packageSuffixes.clear();
            const QStringList suffixes = s.value(QStringLiteral("packageSuffixes")).toStringList();
            for (const QString& suffix : suffixes) {
                const QString trimmed = suffix.trimmed();
                if (!trimmed.isEmpty()) {
                    options.packageSuffixes.push_back(trimmed.toStdString());
                }
            }
        }

        s.endGroup();
        return options;
    }

    void saveScanOptions(QSettings& s, const DirectoryScannerEngine::ScanOptions& options) {
        QStringList suffixes;
        for (const auto& suffix : options.packageSuffixes) {
            suffixes << QString::fromStdString(suffix);
        }

        s.beginGroup(QStringLiteral("scan"));
        s.setValue(QStringLiteral("useLogicalSizes"), options.sizeMode == DirectoryScannerEngine::SizeMode::Logical);
        s.setValue(QStringLiteral("stayOnFilesystem"), options.stayOnFilesystem);
        s.setValue(QStringLiteral("packageSuffixes"), suffixes);
        s.endGroup();
    }

    void clampLayoutOptions(LayoutEngine::LayoutOptions& options) {
        options.maxRings = std::clamp(options.maxRings, 1, kMaxRingsLimit);
        options.baseDepth = std::clamp(options.baseDepth, 1, options.maxRings);
    }

    LayoutEngine::LayoutOptions loadLayoutOptions(QSettings& s) {
        LayoutEngine::LayoutOptions options;

        s.beginGroup(QStringLiteral("chart"));
        options.baseDepth = s.value(QStringLiteral("baseDepth"), options.baseDepth).toInt();
        options.maxRings = s.value(QStringLiteral("maxRings"), options.maxRings).toInt();
        s.endGroup();

        clampLayoutOptions(options);
        return options;
    }

    void saveLayoutOptions(QSettings& s, const LayoutEngine::LayoutOptions& options) {
        s.beginGroup(QStringLiteral("chart"));
        s.setValue(QStringLiteral("baseDepth"), options.baseDepth);
        s.setValue(QStringLiteral("maxRings"), options.maxRings);
        s.endGroup();
    }
}
