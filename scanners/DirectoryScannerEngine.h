// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_DIRECTORYSCANNERENGINE_H
#define RINGDU_DIRECTORYSCANNERENGINE_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../FileSystemEntry.h"

namespace DirectoryScannerEngine {

    enum class SizeMode {
        Allocated, // st_blocks * 512, falling back to st_size
        Logical    // st_size
    };

    struct ScanOptions {
        SizeMode sizeMode = SizeMode::Allocated;

        // Directories whose name ends with one of these (case-insensitive) are
        // measured as a whole and exposed as leaves.
        std::vector<std::string> packageSuffixes{".app", ".bundle", ".framework", ".plugin", ".kext", ".AppDir"};

        // Record directories on another device than the root as empty (like du -x)
        bool stayOnFilesystem = false;
    };

    enum class ScanStatus {
        Completed,
        Cancelled,
        NotFound,
        NotAccessible
    };

    struct ScanResult {
        ScanStatus status = ScanStatus::Cancelled;
        std::optional<FileSystemEntry> root; // Only set when status == Completed
        std::string error;                   // Only set for NotFound / NotAccessible
    };

    /**
     * Progress callback: called with (fraction, name of the last completed top-level
     * item). May be invoked from worker threads, but never concurrently with itself.
     */
    using ProgressCallback = std::function<void(double fraction, const std::string& itemName)>;

    /**
     * Measures the tree rooted at the given path.
     *
     * Every directory fans its immediate children out as concurrent tasks and joins
     * them before building its own node, so a parent is never finished before all of
     * its children. Unreadable entries are sized as zero instead of failing the scan;
     * only a missing or inaccessible root is reported as an error.
     *
     * @param rootPath Path to scan. Relative paths are made absolute, symlinks on
     *                 the root itself are followed.
     * @param cancelRequested Checked before every filesystem access. Once it is set,
     *                        the scan stops starting new work and resolves to
     *                        ScanStatus::Cancelled without a tree.
     * @param options Sizing and package rules.
     * @param progressCb Receives strictly increasing fractions as the root's
     *                   immediate children complete, then a final 1.0 once the
     *                   whole tree is built. Can be null.
     * @return The scan outcome. The tree is not percentage-annotated.
     */
    ScanResult scanTree(const std::string& rootPath,
                        const std::atomic<bool>& cancelRequested,
                        const ScanOptions& options = {},
                        ProgressCallback progressCb = {});

    /**
     * Sums the sizes of everything below a package directory in a single
     * synchronous walk. Permission-denied subtrees are skipped and symlinks are not
     * followed.
     *
     * @return The total, or std::nullopt if cancellation was observed during the walk.
     */
    std::optional<uint64_t> measurePackage(const std::string& path,
                                           const std::atomic<bool>& cancelRequested,
                                           const ScanOptions& options = {});

    /**
     * Whether a directory with this name is treated as a package.
     */
    [[nodiscard]] bool isPackageName(std::string_view name, const ScanOptions& options);
}

#endif //RINGDU_DIRECTORYSCANNERENGINE_H
