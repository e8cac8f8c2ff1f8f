// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <memory>
#include <QDebug>
#include <QFileInfo>
#include <QUrl>
#include <KIO/CopyJob>
#include "TrashService.h"

bool KioTrashProvider::moveToTrash(const QString& path, QString* error) {
    if (!QFileInfo::exists(path)) {
        if (error) *error = QStringLiteral("%1 no longer exists.").arg(path);
        return false;
    }

    // Keep the job alive past exec() so its error can still be read
    std::unique_ptr<KIO::CopyJob> job(KIO::trash(QUrl::fromLocalFile(path), KIO::HideProgressInfo));
    job->setAutoDelete(false);

    if (!job->exec()) {
        qWarning().noquote() << "Moving" << path << "to trash failed:" << job->errorString();
        if (error) *error = job->errorString();
        return false;
    }

    qInfo().noquote() << "Moved to trash:" << path;
    return true;
}
