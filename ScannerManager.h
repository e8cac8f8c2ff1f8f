// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_SCANNERMANAGER_H
#define RINGDU_SCANNERMANAGER_H

#include <QMetaType>
#include <QObject>
#include <QString>
#include <atomic>
#include <memory>
#include <thread>
#include "FileSystemEntry.h"
#include "TrashService.h"
#include "scanners/DirectoryScannerEngine.h"

using FileSystemEntryPtr = std::shared_ptr<const FileSystemEntry>;
Q_DECLARE_METATYPE(FileSystemEntryPtr)

class ScannerManager : public QObject {
    Q_OBJECT
public:
    explicit ScannerManager(QObject *parent = nullptr);
    ~ScannerManager() override;

    /**
     * @brief Starts scanning the given path on a worker thread.
     *
     * Any scan still in progress is cancelled first, and this call blocks until
     * all of its tasks have stopped, so two scans never run at the same time.
     * Results are delivered through scanCompleted() or errorMessage(), always
     * followed by scannerFinished().
     */
    void startScan(const QString &path);

    /**
     * @brief Scans the last requested path again, e.g. after moving an item to the trash.
     * @return false if nothing was scanned yet.
     */
    bool rescan();

    /**
     * @brief Cancels the running scan, if any, and waits for its tasks to stop.
     * Emits scanCancelled() and scannerFinished(). The previous result is kept.
     */
    void cancelScan();

    [[nodiscard]] bool isRunning() const { return m_isRunning; }

    /**
     * @brief The last successfully scanned and annotated tree, or null.
     */
    [[nodiscard]] FileSystemEntryPtr rootNode() const { return m_root; }
    [[nodiscard]] QString lastScanPath() const { return m_lastPath; }

    [[nodiscard]] const DirectoryScannerEngine::ScanOptions& scanOptions() const { return m_options; }
    void setScanOptions(const DirectoryScannerEngine::ScanOptions &options) { m_options = options; }

    /**
     * @brief Replaces the trash backend. The manager takes ownership.
     */
    void setTrashProvider(std::unique_ptr<TrashProvider> provider);

    /**
     * @brief Moves the entry's path to the trash through the trash provider.
     *
     * The in-memory tree is left untouched either way; callers rescan to see the
     * change. On failure errorMessage() is emitted.
     */
    bool moveToTrash(const FileSystemEntry &entry);

signals:
    void scannerStarted();
    void scannerFinished();
    void progressChanged(double fraction, const QString &itemName);
    void progressMessage(const QString &message);
    void scanCompleted(FileSystemEntryPtr root);
    void scanCancelled();
    void errorMessage(const QString &title, const QString &message);
    void trashCompleted(const QString &path);

private:
    void joinWorker();
    void finishScan(quint64 generation, const std::shared_ptr<DirectoryScannerEngine::ScanResult> &result);

    std::thread m_worker;
    std::shared_ptr<std::atomic<bool>> m_cancelRequested;

    // Bumped for every scan, events from an older generation are dropped
    quint64 m_generation = 0;
    bool m_isRunning = false;

    QString m_lastPath;
    FileSystemEntryPtr m_root;
    DirectoryScannerEngine::ScanOptions m_options;
    std::unique_ptr<TrashProvider> m_trash;
};

#endif //RINGDU_SCANNERMANAGER_H
