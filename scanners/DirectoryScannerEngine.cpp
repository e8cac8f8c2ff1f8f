// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <sys/stat.h>
#include <tbb/task_group.h>
#include <QDebug>
#include <QString>
#include "DirectoryScannerEngine.h"

namespace fs = std::filesystem;

namespace DirectoryScannerEngine {

    namespace {
        // Everything a scan task needs. Shared read-only by all tasks of one scan.
        struct ScanContext {
            const std::atomic<bool>& cancelRequested;
            const ScanOptions& options;
            dev_t rootDevice;

            [[nodiscard]] bool cancelled() const {
                return cancelRequested.load(std::memory_order_relaxed);
            }
        };

        /**
         * Counts completed children of the scan root and turns the count into
         * progress events. This is the only state that sibling tasks write to.
         */
        class ProgressTracker {
        public:
            ProgressTracker(size_t total, ProgressCallback cb) : m_total(total), m_cb(std::move(cb)) {}

            void childCompleted(const std::string& itemName) {
                // fetch_add hands every finished child its own count, no matter which thread it ran on
                const size_t done = m_completed.fetch_add(1, std::memory_order_acq_rel) + 1;

                // 1.0 is reserved for the terminal event sent once the root node is built
                if (!m_cb || done >= m_total) {
                    return;
                }

                const double fraction = static_cast<double>(done) / static_cast<double>(m_total);

                // Counts can finish out of order across threads; only report increases
                std::lock_guard<std::mutex> lock(m_mutex);
                if (fraction > m_lastFraction) {
                    m_lastFraction = fraction;
                    m_cb(fraction, itemName);
                }
            }

        private:
            const size_t m_total;
            ProgressCallback m_cb;
            std::atomic<size_t> m_completed{0};
            std::mutex m_mutex;
            double m_lastFraction = 0.0;
        };

        QString toQString(const fs::path& path) {
            return QString::fromStdString(path.string());
        }

        std::string entryName(const fs::path& path) {
            std::string name = path.filename().string();
            // Only "/" has no file name after normalization
            return name.empty() ? path.string() : name;
        }

        uint64_t sizeFromStat(const struct stat& st, SizeMode mode) {
            const uint64_t logical = st.st_size > 0 ? static_cast<uint64_t>(st.st_size) : 0;
            if (mode == SizeMode::Logical) {
                return logical;
            }

            const uint64_t allocated = static_cast<uint64_t>(st.st_blocks) * 512;

            // Some FUSE and network filesystems report zero blocks for everything
            return (allocated == 0 && logical > 0) ? logical : allocated;
        }

        /**
         * Reads the names of a directory's immediate children in enumeration order.
         * Any error, including one half way through, fails the whole listing so that
         * a directory is either fully listed or treated as empty.
         */
        bool listDirectory(const fs::path& dir, std::vector<fs::path>& out, std::error_code& ec) {
            fs::directory_iterator it(dir, fs::directory_options::none, ec);
            if (ec) {
                return false;
            }

            const fs::directory_iterator end;
            while (it != end) {
                out.push_back(it->path());
                it.increment(ec);
                if (ec) {
                    out.clear();
                    return false;
                }
            }
            return true;
        }

        std::optional<FileSystemEntry> scanEntry(const fs::path& path, const ScanContext& ctx);

        /**
         * Scans every listed child as its own task and builds the directory node once
         * all of them have joined. Each task writes only to its own result slot, so the
         * slots keep enumeration order for the stable sort in makeDirectory().
         */
        std::optional<FileSystemEntry> buildDirectory(const fs::path& path,
                                                      const std::vector<fs::path>& entries,
                                                      const ScanContext& ctx,
                                                      ProgressTracker* tracker) {
            if (ctx.cancelled()) {
                return std::nullopt;
            }

            std::vector<std::optional<FileSystemEntry>> results(entries.size());

            tbb::task_group group;
            for (size_t i = 0; i < entries.size(); ++i) {
                group.run([&entries, &results, &ctx, tracker, i] {
                    if (ctx.cancelled()) {
                        return;
                    }

                    results[i] = scanEntry(entries[i], ctx);

                    if (tracker && !ctx.cancelled()) {
                        tracker->childCompleted(results[i] ? results[i]->name : entryName(entries[i]));
                    }
                });
            }
            group.wait();

            // A cancelled branch never yields a partial node
            if (ctx.cancelled()) {
                return std::nullopt;
            }

            std::vector<FileSystemEntry> children;
            children.reserve(results.size());
            for (auto& result : results) {
                if (result) {
                    children.push_back(std::move(*result));
                }
            }

            return FileSystemEntry::makeDirectory(path.string(), entryName(path), std::move(children));
        }

        std::optional<FileSystemEntry> scanDirectory(const fs::path& path, const ScanContext& ctx) {
            if (ctx.cancelled()) {
                return std::nullopt;
            }

            std::vector<fs::path> entries;
            std::error_code ec;
            if (!listDirectory(path, entries, ec)) {
                qDebug().noquote() << "Cannot list" << toQString(path) << "-" << QString::fromStdString(ec.message());
                return FileSystemEntry::makeDirectory(path.string(), entryName(path), {});
            }

            return buildDirectory(path, entries, ctx, nullptr);
        }

        std::optional<FileSystemEntry> scanEntry(const fs::path& path, const ScanContext& ctx) {
            if (ctx.cancelled()) {
                return std::nullopt;
            }

            const std::string name = entryName(path);

            struct stat st {};
            if (::lstat(path.c_str(), &st) != 0) {
                const int err = errno;
                if (err == ENOENT) {
                    // Deleted between listing and stat, leave it out
                    qDebug().noquote() << "Entry vanished during scan:" << toQString(path);
                    return std::nullopt;
                }
                qDebug().noquote() << "lstat failed for" << toQString(path) << "-" << std::strerror(err);
                return FileSystemEntry::makeFile(path.string(), name, 0);
            }

            if (!S_ISDIR(st.st_mode)) {
                return FileSystemEntry::makeFile(path.string(), name, sizeFromStat(st, ctx.options.sizeMode));
            }

            if (isPackageName(name, ctx.options)) {
                auto size = measurePackage(path.string(), ctx.cancelRequested, ctx.options);
                if (!size) {
                    return std::nullopt;
                }
                return FileSystemEntry::makePackage(path.string(), name, *size);
            }

            if (ctx.options.stayOnFilesystem && st.st_dev != ctx.rootDevice) {
                qDebug().noquote() << "Not descending into other filesystem at" << toQString(path);
                return FileSystemEntry::makeDirectory(path.string(), name, {});
            }

            return scanDirectory(path, ctx);
        }

        fs::path normalizeRoot(const std::string& rootPath, std::error_code& ec) {
            fs::path root = fs::absolute(fs::path(rootPath), ec);
            if (ec) {
                return {};
            }

            root = root.lexically_normal();

            // "/a/b/" normalizes to "/a/b/" with an empty file name; drop the separator
            if (root.has_relative_path() && !root.has_filename()) {
                root = root.parent_path();
            }
            return root;
        }
    }

    bool isPackageName(std::string_view name, const ScanOptions& options) {
        auto lower = [](unsigned char c) { return static_cast<char>(std::tolower(c)); };

        for (const auto& suffix : options.packageSuffixes) {
            // The suffix alone (e.g. a directory called ".app") is not a package
            if (suffix.empty() || name.size() <= suffix.size()) {
                continue;
            }

            const std::string_view tail = name.substr(name.size() - suffix.size());
            const bool match = std::equal(tail.begin(), tail.end(), suffix.begin(), suffix.end(),
                [&](char a, char b) {
                    return lower(static_cast<unsigned char>(a)) == lower(static_cast<unsigned char>(b));
                });

            if (match) {
                return true;
            }
        }
        return false;
    }

    std::optional<uint64_t> measurePackage(const std::string& path,
                                           const std::atomic<bool>& cancelRequested,
                                           const ScanOptions& options) {
        uint64_t total = 0;

        std::error_code ec;
        fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            qDebug().noquote() << "Cannot read package" << QString::fromStdString(path) << "-" << QString::fromStdString(ec.message());
            return total;
        }

        const fs::recursive_directory_iterator end;
        while (it != end) {
            if (cancelRequested.load(std::memory_order_relaxed)) {
                return std::nullopt;
            }

            // Directories themselves contribute nothing, matching how regular directories are sized
            struct stat st {};
            if (::lstat(it->path().c_str(), &st) == 0 && !S_ISDIR(st.st_mode)) {
                total += sizeFromStat(st, options.sizeMode);
            }

            it.increment(ec);
            if (ec) {
                qDebug().noquote() << "Package walk stopped early in" << QString::fromStdString(path)
                                   << "-" << QString::fromStdString(ec.message());
                break;
            }
        }

        return total;
    }

    ScanResult scanTree(const std::string& rootPath,
                        const std::atomic<bool>& cancelRequested,
                        const ScanOptions& options,
                        ProgressCallback progressCb) {
        ScanResult result;

        if (cancelRequested.load(std::memory_order_relaxed)) {
            result.status = ScanStatus::Cancelled;
            return result;
        }

        std::error_code ec;
        const fs::path root = normalizeRoot(rootPath, ec);
        if (ec) {
            result.status = ScanStatus::NotAccessible;
            result.error = rootPath + ": " + ec.message();
            qWarning().noquote() << "Cannot resolve scan root:" << QString::fromStdString(result.error);
            return result;
        }

        // The root is the only path whose symlinks are followed
        struct stat st {};
        if (::stat(root.c_str(), &st) != 0) {
            const int err = errno;
            result.status = (err == ENOENT || err == ENOTDIR) ? ScanStatus::NotFound : ScanStatus::NotAccessible;
            result.error = root.string() + ": " + std::strerror(err);
            qWarning().noquote() << "Cannot scan" << QString::fromStdString(result.error);
            return result;
        }

        const std::string name = entryName(root);
        const ScanContext ctx{cancelRequested, options, st.st_dev};

        std::optional<FileSystemEntry> node;

        if (!S_ISDIR(st.st_mode)) {
            node = FileSystemEntry::makeFile(root.string(), name, sizeFromStat(st, options.sizeMode));
        } else {
            // Below the root an unreadable directory just counts as empty, but an
            // unreadable root leaves nothing to show
            std::vector<fs::path> entries;
            if (!listDirectory(root, entries, ec)) {
                result.status = ScanStatus::NotAccessible;
                result.error = root.string() + ": " + ec.message();
                qWarning().noquote() << "Cannot list scan root" << QString::fromStdString(result.error);
                return result;
            }

            qDebug().noquote() << "Scanning" << toQString(root) << "with" << entries.size() << "top-level entries";

            ProgressTracker tracker(entries.size(), progressCb);
            node = buildDirectory(root, entries, ctx, &tracker);
        }

        if (!node || ctx.cancelled()) {
            qDebug().noquote() << "Scan of" << toQString(root) << "cancelled";
            result.status = ScanStatus::Cancelled;
            return result;
        }

        qDebug().noquote() << "Scan of" << toQString(root) << "complete," << node->sizeBytes << "bytes";

        result.status = ScanStatus::Completed;
        result.root = std::move(node);

        if (progressCb) {
            progressCb(1.0, name);
        }

        return result;
    }
}
