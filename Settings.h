// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_SETTINGS_H
#define RINGDU_SETTINGS_H

#include "scanners/DirectoryScannerEngine.h"
#include "chart/LayoutEngine.h"

class QSettings;

namespace Settings {
    /**
     * Reads the "scan" group: useLogicalSizes, stayOnFilesystem and
     * packageSuffixes. Missing keys keep the ScanOptions defaults.
     */
    [[nodiscard]] DirectoryScannerEngine::ScanOptions loadScanOptions(QSettings& s);
    void saveScanOptions(QSettings& s, const DirectoryScannerEngine::ScanOptions& options);

    /**
     * Reads the "chart" group: baseDepth and maxRings. Values are clamped so that
     * 1 <= baseDepth <= maxRings <= kMaxRingsLimit.
     */
    [[nodiscard]] LayoutEngine::LayoutOptions loadLayoutOptions(QSettings& s);
    void saveLayoutOptions(QSettings& s, const LayoutEngine::LayoutOptions& options);

    inline constexpr int kMaxRingsLimit = 32;

    /**
     * Applies the clamping rules of loadLayoutOptions() to options set elsewhere
     * (e.g. on the command line).
     */
    void clampLayoutOptions(LayoutEngine::LayoutOptions& options);
}

#endif //RINGDU_SETTINGS_H
