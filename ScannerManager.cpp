// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QDebug>
#include <QMetaObject>
#include "ScannerManager.h"

ScannerManager::ScannerManager(QObject *parent)
    : QObject(parent), m_trash(std::make_unique<KioTrashProvider>()) {
    qRegisterMetaType<FileSystemEntryPtr>();
}

ScannerManager::~ScannerManager() {
    // If the manager is destroyed while a scan is running
    // (e.g. the application is quitting), stop the tasks before tearing down.
    if (m_cancelRequested) {
        m_cancelRequested->store(true);
    }
    joinWorker();
}

void ScannerManager::joinWorker() {
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void ScannerManager::startScan(const QString &path) {
    // Only one scan at a time: the previous one must have fully stopped
    // before this one touches the filesystem.
    if (m_isRunning) {
        cancelScan();
    }
    joinWorker();

    const quint64 generation = ++m_generation;
    m_cancelRequested = std::make_shared<std::atomic<bool>>(false);
    m_lastPath = path;
    m_isRunning = true;

    Q_EMIT scannerStarted();
    Q_EMIT progressMessage(QStringLiteral("Scanning %1...").arg(path));
    qDebug().noquote() << "Starting scan of" << path;

    auto cancel = m_cancelRequested;
    const DirectoryScannerEngine::ScanOptions options = m_options;
    const std::string rootPath = path.toStdString();

    m_worker = std::thread([this, generation, cancel, options, rootPath]() {
        // Called from scan tasks. Hop over to the manager's thread and let it decide
        // whether the event still belongs to the current scan.
        auto progressCb = [this, generation](double fraction, const std::string &itemName) {
            const QString name = QString::fromStdString(itemName);
            QMetaObject::invokeMethod(this, [this, generation, fraction, name]() {
                if (generation != m_generation || !m_isRunning) {
                    return;
                }
                Q_EMIT progressChanged(fraction, name);
            }, Qt::QueuedConnection);
        };

        auto result = std::make_shared<DirectoryScannerEngine::ScanResult>(
            DirectoryScannerEngine::scanTree(rootPath, *cancel, options, progressCb));

        QMetaObject::invokeMethod(this, [this, generation, result]() {
            finishScan(generation, result);
        }, Qt::QueuedConnection);
    });
}

bool ScannerManager::rescan() {
    if (m_lastPath.isEmpty()) {
        return false;
    }
    startScan(m_lastPath);
    return true;
}

void ScannerManager::cancelScan() {
    if (!m_isRunning) {
        return;
    }

    qDebug().noquote() << "Cancellation requested for" << m_lastPath;

    m_cancelRequested->store(true);

    // Returns once every scan task has seen the flag
    joinWorker();

    // Anything this scan still has queued is now stale
    ++m_generation;
    m_isRunning = false;

    Q_EMIT progressMessage(QStringLiteral("Scanner cancelled."));
    Q_EMIT scanCancelled();
    Q_EMIT scannerFinished();
}

void ScannerManager::finishScan(quint64 generation, const std::shared_ptr<DirectoryScannerEngine::ScanResult> &result) {
    if (generation != m_generation) {
        qDebug() << "Dropping result of superseded scan" << generation;
        return;
    }

    joinWorker();
    m_isRunning = false;

    using DirectoryScannerEngine::ScanStatus;

    switch (result->status) {
        case ScanStatus::Completed: {
            auto root = std::make_shared<FileSystemEntry>(std::move(*result->root));
            annotatePercentages(*root);
            m_root = std::move(root);

            qDebug().noquote() << "Scan of" << m_lastPath << "finished," << m_root->sizeBytes << "bytes";
            Q_EMIT progressMessage(QStringLiteral("Scan complete."));
            Q_EMIT scanCompleted(m_root);
            break;
        }
        case ScanStatus::Cancelled:
            Q_EMIT progressMessage(QStringLiteral("Scanner cancelled."));
            Q_EMIT scanCancelled();
            break;
        case ScanStatus::NotFound:
            Q_EMIT progressMessage(QStringLiteral("Scanner failed."));
            Q_EMIT errorMessage(QStringLiteral("Folder Not Found"),
                QStringLiteral("The folder could not be found.\n\n%1")
                .arg(QString::fromStdString(result->error)));
            break;
        case ScanStatus::NotAccessible:
            Q_EMIT progressMessage(QStringLiteral("Scanner failed."));
            Q_EMIT errorMessage(QStringLiteral("Folder Not Accessible"),
                QStringLiteral("The folder could not be read. Check that you have permission to open it.\n\n%1")
                .arg(QString::fromStdString(result->error)));
            break;
    }

    Q_EMIT scannerFinished();
}

void ScannerManager::setTrashProvider(std::unique_ptr<TrashProvider> provider) {
    m_trash = std::move(provider);
}

bool ScannerManager::moveToTrash(const FileSystemEntry &entry) {
    const QString path = QString::fromStdString(entry.path);

    if (!m_trash) {
        Q_EMIT errorMessage(QStringLiteral("Move to Trash Failed"), QStringLiteral("No trash backend is available."));
        return false;
    }

    QString err;
    if (!m_trash->moveToTrash(path, &err)) {
        Q_EMIT errorMessage(QStringLiteral("Move to Trash Failed"),
            QStringLiteral("Could not move %1 to the trash.\n\n%2").arg(path, err));
        return false;
    }

    Q_EMIT trashCompleted(path);
    return true;
}
