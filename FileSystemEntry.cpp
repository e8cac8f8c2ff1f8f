// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <atomic>
#include "FileSystemEntry.h"

uint64_t FileSystemEntry::nextId() {
    static std::atomic<uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

FileSystemEntry FileSystemEntry::makeFile(std::string path, std::string name, uint64_t sizeBytes) {
    FileSystemEntry entry;
    entry.path = std::move(path);
    entry.id = nextId();
    entry.name = std::move(name);
    entry.sizeBytes = sizeBytes;
    return entry;
}

FileSystemEntry FileSystemEntry::makePackage(std::string path, std::string name, uint64_t sizeBytes) {
    FileSystemEntry entry = makeFile(std::move(path), std::move(name), sizeBytes);
    entry.isDirectory = true;
    entry.isPackage = true;
    return entry;
}

FileSystemEntry FileSystemEntry::makeDirectory(std::string path, std::string name, std::vector<FileSystemEntry> children) {
    FileSystemEntry entry;
    entry.path = std::move(path);
    entry.id = nextId();
    entry.name = std::move(name);
    entry.isDirectory = true;

    for (const auto& child : children) {
        entry.sizeBytes += child.sizeBytes;
    }

    // stable_sort keeps enumeration order between entries of equal size
    std::stable_sort(children.begin(), children.end(), [](const FileSystemEntry& a, const FileSystemEntry& b) {
        return a.sizeBytes > b.sizeBytes;
    });

    entry.children = std::move(children);
    return entry;
}

void annotatePercentages(FileSystemEntry& node, uint64_t totalSize) {
    node.percentageOfTotal = totalSize > 0
        ? static_cast<double>(node.sizeBytes) / static_cast<double>(totalSize) * 100.0
        : 0.0;

    if (node.children) {
        for (auto& child : *node.children) {
            annotatePercentages(child, totalSize);
        }
    }
}

void annotatePercentages(FileSystemEntry& root) {
    annotatePercentages(root, root.sizeBytes);
}

const FileSystemEntry* findEntryById(const FileSystemEntry& root, uint64_t id) {
    if (root.id == id) {
        return &root;
    }
    if (root.children) {
        for (const auto& child : *root.children) {
            if (const FileSystemEntry* found = findEntryById(child, id)) {
                return found;
            }
        }
    }
    return nullptr;
}

const FileSystemEntry* findEntryByPath(const FileSystemEntry& root, const std::string& path) {
    if (root.path == path) {
        return &root;
    }
    if (!root.children) {
        return nullptr;
    }

    // Only descend into the child whose path is a directory prefix of the target
    for (const auto& child : *root.children) {
        const std::string& p = child.path;
        if (path.size() < p.size() || path.compare(0, p.size(), p) != 0) {
            continue;
        }
        if (path.size() == p.size() || path[p.size()] == '/') {
            return findEntryByPath(child, path);
        }
    }
    return nullptr;
}
