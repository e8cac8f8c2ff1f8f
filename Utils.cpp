// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QMimeDatabase>
#include <QMimeType>
#include <KFormat>
#include "Utils.h"

namespace Utils {
    QString formatByteSize(uint64_t bytes) {
        static const KFormat format;
        return format.formatByteSize(static_cast<double>(bytes), 1);
    }

    QString formatPercentage(double percentage) {
        return QString::number(percentage, 'f', 1) + QLatin1Char('%');
    }

    QString entryKind(const FileSystemEntry& entry) {
        if (entry.isPackage) {
            return QStringLiteral("package");
        }
        if (entry.isDirectory) {
            return QStringLiteral("folder");
        }

        static const QMimeDatabase mimeDb;
        const QMimeType mime = mimeDb.mimeTypeForFile(QString::fromStdString(entry.name), QMimeDatabase::MatchExtension);
        const QString name = mime.name();

        if (name.startsWith(QLatin1String("image/"))) return QStringLiteral("image");
        if (name.startsWith(QLatin1String("video/"))) return QStringLiteral("video");
        if (name.startsWith(QLatin1String("audio/"))) return QStringLiteral("audio");

        if (mime.inherits(QStringLiteral("application/x-cd-image"))
            || mime.inherits(QStringLiteral("application/x-raw-disk-image"))
            || name == QLatin1String("application/x-apple-diskimage")) {
            return QStringLiteral("disk-image");
        }

        if (mime.inherits(QStringLiteral("application/zip"))
            || mime.inherits(QStringLiteral("application/x-tar"))
            || mime.inherits(QStringLiteral("application/gzip"))
            || mime.inherits(QStringLiteral("application/x-7z-compressed"))
            || mime.inherits(QStringLiteral("application/vnd.rar"))
            || mime.inherits(QStringLiteral("application/x-compressed-tar"))) {
            return QStringLiteral("archive");
        }

        if (name == QLatin1String("application/pdf") || mime.inherits(QStringLiteral("text/plain"))) {
            return QStringLiteral("document");
        }

        return QStringLiteral("file");
    }
}
