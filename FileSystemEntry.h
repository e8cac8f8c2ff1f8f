// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_FILESYSTEMENTRY_H
#define RINGDU_FILESYSTEMENTRY_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * One file or directory of a scanned tree.
 *
 * Entries are built bottom-up by the scanner and never change shape afterwards.
 * The only field written after construction is percentageOfTotal, which is
 * filled in once by annotatePercentages().
 */
struct FileSystemEntry {
    std::string path;           // Absolute path
    uint64_t id = 0;            // Unique per scan session, 0 means "no entry"
    std::string name;           // Display name
    bool isDirectory = false;
    bool isPackage = false;     // Directory exposed as a single leaf
    uint64_t sizeBytes = 0;

    // Sorted by sizeBytes descending. Absent for files and packages,
    // present (possibly empty) for ordinary directories.
    std::optional<std::vector<FileSystemEntry>> children;

    double percentageOfTotal = 0.0;

    [[nodiscard]] bool hasChildren() const { return children && !children->empty(); }
    [[nodiscard]] size_t childCount() const { return children ? children->size() : 0; }

    /**
     * Returns a fresh id. Ids are handed out from a process-wide counter so that two
     * scans of the same path never share an id.
     */
    static uint64_t nextId();

    static FileSystemEntry makeFile(std::string path, std::string name, uint64_t sizeBytes);
    static FileSystemEntry makePackage(std::string path, std::string name, uint64_t sizeBytes);

    /**
     * Builds a directory node from its children. The size is the sum of the
     * children's sizes and the children are stable-sorted by size, descending,
     * so entries of equal size keep the order they were passed in.
     */
    static FileSystemEntry makeDirectory(std::string path, std::string name, std::vector<FileSystemEntry> children);
};

/**
 * Writes percentageOfTotal = 100 * sizeBytes / totalSize into the node and all of
 * its descendants, or 0 everywhere if totalSize is 0.
 */
void annotatePercentages(FileSystemEntry& node, uint64_t totalSize);

/**
 * Annotates the whole tree relative to the root's own size.
 */
void annotatePercentages(FileSystemEntry& root);

/**
 * Depth-first lookup by id. Returns nullptr if the id is not in the subtree.
 */
const FileSystemEntry* findEntryById(const FileSystemEntry& root, uint64_t id);

/**
 * Lookup by absolute path, descending only through matching path prefixes.
 */
const FileSystemEntry* findEntryByPath(const FileSystemEntry& root, const std::string& path);

#endif //RINGDU_FILESYSTEMENTRY_H
