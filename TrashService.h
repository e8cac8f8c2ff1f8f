// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_TRASHSERVICE_H
#define RINGDU_TRASHSERVICE_H

#include <QString>

/**
 * Moves files to the desktop trash. The scanner never deletes anything itself;
 * it hands the path to a provider and reports the outcome.
 */
class TrashProvider {
public:
    virtual ~TrashProvider() = default;

    /**
     * Moves the file or directory at path to the trash.
     *
     * @param path Absolute local path.
     * @param error Receives a human-readable reason on failure. Can be null.
     * @return true on success.
     */
    virtual bool moveToTrash(const QString& path, QString* error) = 0;
};

/**
 * Trash provider backed by KIO. Items land in the freedesktop.org trash
 * of the mount they live on, with restore information.
 */
class KioTrashProvider final : public TrashProvider {
public:
    bool moveToTrash(const QString& path, QString* error) override;
};

#endif //RINGDU_TRASHSERVICE_H
