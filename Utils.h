// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_UTILS_H
#define RINGDU_UTILS_H

#include <QString>
#include <cstdint>
#include "FileSystemEntry.h"

namespace Utils {
    /**
     * Formats a byte count for display using the user's KDE unit preferences,
     * e.g. "1.4 GiB".
     */
    [[nodiscard]] QString formatByteSize(uint64_t bytes);

    /**
     * Formats a percentage with one decimal, e.g. "12.5%".
     */
    [[nodiscard]] QString formatPercentage(double percentage);

    /**
     * Coarse kind of an entry used to label it in listings: "folder", "package",
     * "image", "video", "audio", "document", "archive", "disk-image" or "file".
     * Files are classified by MIME type guessed from their name, without reading them.
     */
    [[nodiscard]] QString entryKind(const FileSystemEntry& entry);
}

#endif //RINGDU_UTILS_H
