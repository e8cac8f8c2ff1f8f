// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <atomic>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>
#include "scanners/DirectoryScannerEngine.h"
#include "TestSupport.h"

using namespace DirectoryScannerEngine;
using TestSupport::expect;
using TestSupport::TempDir;

namespace {

ScanOptions logicalOptions() {
    ScanOptions options;
    options.sizeMode = SizeMode::Logical;
    return options;
}

const FileSystemEntry* childNamed(const FileSystemEntry& dir, const std::string& name) {
    if (!dir.children) {
        return nullptr;
    }
    for (const auto& child : *dir.children) {
        if (child.name == name) {
            return &child;
        }
    }
    return nullptr;
}

// Checks size aggregation and ordering on every directory of the tree
void checkInvariants(const FileSystemEntry& node) {
    if (!node.children) {
        return;
    }

    uint64_t sum = 0;
    for (size_t i = 0; i < node.children->size(); ++i) {
        const auto& child = (*node.children)[i];
        sum += child.sizeBytes;
        if (i > 0) {
            expect((*node.children)[i - 1].sizeBytes >= child.sizeBytes, "children sorted descending in " + node.path);
        }
        checkInvariants(child);
    }
    expect(sum == node.sizeBytes, "directory size equals sum of children in " + node.path);
}

void testFixtureTree() {
    TempDir dir("fixture");
    dir.writeFile("a.txt", 100);
    dir.writeFile("sub/b.txt", 300);

    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree(dir.path().string(), cancel, logicalOptions());

    expect(result.status == ScanStatus::Completed, "fixture scan completes");
    expect(result.root.has_value(), "completed scan has a tree");
    if (!result.root) {
        return;
    }

    const FileSystemEntry& root = *result.root;
    expect(root.path == dir.path().string(), "root keeps the absolute path");
    expect(root.sizeBytes == 400, "root size is 400");
    expect(root.childCount() == 2, "root has two children");
    expect((*root.children)[0].name == "sub", "largest child first");
    expect((*root.children)[0].sizeBytes == 300, "sub is 300 bytes");
    expect((*root.children)[1].name == "a.txt", "a.txt second");
    expect((*root.children)[1].sizeBytes == 100, "a.txt is 100 bytes");
    expect(!(*root.children)[1].children.has_value(), "files have no children");
    expect(root.percentageOfTotal == 0.0, "scan result is not annotated");

    const FileSystemEntry* b = findEntryByPath(root, (dir.path() / "sub" / "b.txt").string());
    expect(b && b->sizeBytes == 300, "nested file found by absolute path");
}

void testInvariantsOnWiderTree() {
    TempDir dir("wide");
    for (int i = 0; i < 6; ++i) {
        const std::string top = "d" + std::to_string(i);
        for (int j = 0; j < 5; ++j) {
            dir.writeFile(top + "/f" + std::to_string(j), static_cast<uint64_t>((i + 1) * 10 + j));
            dir.writeFile(top + "/nested/g" + std::to_string(j), static_cast<uint64_t>(j * 7));
        }
    }
    dir.makeDir("emptydir");
    dir.writeFile("same1", 42);
    dir.writeFile("same2", 42);

    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree(dir.path().string(), cancel, logicalOptions());

    expect(result.status == ScanStatus::Completed, "wide scan completes");
    if (!result.root) {
        return;
    }
    checkInvariants(*result.root);

    const FileSystemEntry* empty = childNamed(*result.root, "emptydir");
    expect(empty && empty->children && empty->children->empty(), "empty directory has an empty children collection");
}

void testMissingRoot() {
    TempDir dir("missing");
    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree((dir.path() / "does-not-exist").string(), cancel, logicalOptions());

    expect(result.status == ScanStatus::NotFound, "missing root reports NotFound");
    expect(!result.root.has_value(), "missing root has no tree");
    expect(!result.error.empty(), "missing root carries an error message");
}

void testFileRoot() {
    TempDir dir("fileroot");
    const auto file = dir.writeFile("single.bin", 1234);

    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree(file.string(), cancel, logicalOptions());

    expect(result.status == ScanStatus::Completed, "file root completes");
    expect(result.root && !result.root->isDirectory, "file root is a leaf");
    expect(result.root && result.root->sizeBytes == 1234, "file root has its own size");
    expect(result.root && result.root->name == "single.bin", "file root named after the file");
}

void testPackagesAreLeaves() {
    TempDir dir("package");
    dir.writeFile("Thing.app/Contents/binary", 10);
    dir.writeFile("Thing.app/Contents/Resources/data", 20);
    dir.writeFile("other", 5);

    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree(dir.path().string(), cancel, logicalOptions());
    expect(result.status == ScanStatus::Completed, "package scan completes");
    if (!result.root) {
        return;
    }

    const FileSystemEntry* package = childNamed(*result.root, "Thing.app");
    expect(package != nullptr, "package is listed");
    if (package) {
        expect(package->isPackage && package->isDirectory, "package flagged as a package directory");
        expect(!package->children.has_value(), "package exposes no children");
        expect(package->sizeBytes == 30, "package size is the recursive byte sum");
    }
    expect(result.root->sizeBytes == 35, "root includes the package size");

    ScanOptions noPackages = logicalOptions();
    noPackages.packageSuffixes.clear();
    const ScanResult plain = scanTree(dir.path().string(), cancel, noPackages);
    const FileSystemEntry* asDir = plain.root ? childNamed(*plain.root, "Thing.app") : nullptr;
    expect(asDir && asDir->hasChildren() && !asDir->isPackage, "without suffixes the bundle is a normal directory");
}

void testPackageNames() {
    const ScanOptions options;
    expect(isPackageName("Firefox.app", options), "suffix match");
    expect(isPackageName("Firefox.APP", options), "suffix match ignores case");
    expect(isPackageName("Krita.AppDir", options), "AppDir suffix");
    expect(!isPackageName(".app", options), "bare suffix is not a package");
    expect(!isPackageName("application", options), "no suffix, no package");
}

void testMeasurePackageObservesCancel() {
    TempDir dir("pkgcancel");
    dir.writeFile("Big.bundle/a", 1);
    dir.writeFile("Big.bundle/b", 2);

    std::atomic<bool> cancel{true};
    expect(!measurePackage((dir.path() / "Big.bundle").string(), cancel, logicalOptions()).has_value(),
           "cancelled package walk yields no size");

    cancel = false;
    const auto size = measurePackage((dir.path() / "Big.bundle").string(), cancel, logicalOptions());
    expect(size && *size == 3, "package walk sums all files");
}

void testSymlinksAreNotFollowed() {
    TempDir dir("symlink");
    dir.writeFile("real/b.txt", 300);

    std::error_code ec;
    std::filesystem::create_directory_symlink(dir.path() / "real", dir.path() / "link", ec);
    if (ec) {
        std::cerr << "skipping symlink check: " << ec.message() << "\n";
        return;
    }

    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree(dir.path().string(), cancel, logicalOptions());
    const FileSystemEntry* link = result.root ? childNamed(*result.root, "link") : nullptr;

    expect(link != nullptr, "symlink is listed");
    if (link) {
        expect(!link->isDirectory && !link->children, "symlink to a directory is a leaf");
        expect(link->sizeBytes < 300, "symlink does not count its target's content");
    }
}

void testUnreadableDirectoryCountsAsEmpty() {
    if (::geteuid() == 0) {
        std::cerr << "skipping permission check when running as root\n";
        return;
    }

    TempDir dir("locked");
    dir.writeFile("open.txt", 10);
    dir.writeFile("locked/secret.txt", 50);
    ::chmod((dir.path() / "locked").c_str(), 0);

    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree(dir.path().string(), cancel, logicalOptions());

    // Restore so TempDir can clean up
    ::chmod((dir.path() / "locked").c_str(), S_IRWXU);

    expect(result.status == ScanStatus::Completed, "unreadable subdirectory does not fail the scan");
    const FileSystemEntry* locked = result.root ? childNamed(*result.root, "locked") : nullptr;
    expect(locked && locked->sizeBytes == 0, "unreadable directory is zero bytes");
    expect(locked && locked->children && locked->children->empty(), "unreadable directory has no children");
    expect(result.root && result.root->sizeBytes == 10, "root only counts what could be read");
}

void testCancelBeforeStart() {
    TempDir dir("cancelled");
    dir.writeFile("a", 1);

    std::atomic<bool> cancel{true};
    int events = 0;
    const ScanResult result = scanTree(dir.path().string(), cancel, logicalOptions(),
                                       [&events](double, const std::string&) { ++events; });

    expect(result.status == ScanStatus::Cancelled, "pre-cancelled scan reports Cancelled");
    expect(!result.root.has_value(), "cancelled scan has no tree");
    expect(events == 0, "cancelled scan emits no progress");
}

void testCancelMidScanThenRescan() {
    TempDir dir("midcancel");
    for (int i = 0; i < 8; ++i) {
        dir.writeFile("dir" + std::to_string(i) + "/file", 100);
    }

    std::atomic<bool> cancel{false};
    bool sawTerminal = false;
    const ScanResult cancelled = scanTree(dir.path().string(), cancel, logicalOptions(),
        [&cancel, &sawTerminal](double fraction, const std::string&) {
            if (fraction >= 1.0) {
                sawTerminal = true;
            }
            // Cancel as soon as the first top-level entry is done
            cancel = true;
        });

    expect(cancelled.status == ScanStatus::Cancelled, "cancel during scan reports Cancelled");
    expect(!cancelled.root.has_value(), "no partial tree after cancel");
    expect(!sawTerminal, "no terminal progress event after cancel");

    std::atomic<bool> fresh{false};
    const ScanResult again = scanTree(dir.path().string(), fresh, logicalOptions());
    expect(again.status == ScanStatus::Completed, "fresh scan after cancel completes");
    expect(again.root && again.root->sizeBytes == 800, "fresh scan after cancel is complete");
    expect(again.root && again.root->childCount() == 8, "fresh scan sees every directory");
}

void testProgressIsMonotonic() {
    TempDir dir("progress");
    for (int i = 0; i < 10; ++i) {
        dir.writeFile("entry" + std::to_string(i) + "/data", 10 * static_cast<uint64_t>(i + 1));
    }

    std::vector<std::pair<double, std::string>> events;
    std::atomic<bool> cancel{false};
    const ScanResult result = scanTree(dir.path().string(), cancel, logicalOptions(),
        [&events](double fraction, const std::string& name) {
            events.emplace_back(fraction, name);
        });

    expect(result.status == ScanStatus::Completed, "progress scan completes");
    expect(!events.empty(), "progress events were emitted");
    if (events.empty()) {
        return;
    }

    for (size_t i = 1; i < events.size(); ++i) {
        expect(events[i].first > events[i - 1].first, "progress strictly increases");
    }
    for (size_t i = 0; i + 1 < events.size(); ++i) {
        expect(events[i].first < 1.0, "intermediate progress stays below 1.0");
        expect(events[i].second.rfind("entry", 0) == 0, "intermediate events name a top-level entry");
    }
    expect(events.back().first == 1.0, "last progress event is 1.0");
    expect(result.root && events.back().second == result.root->name, "terminal event names the root");
    expect(events.size() <= 10, "at most one event per top-level entry");
}

}  // namespace

int main() {
    testFixtureTree();
    testInvariantsOnWiderTree();
    testMissingRoot();
    testFileRoot();
    testPackagesAreLeaves();
    testPackageNames();
    testMeasurePackageObservesCancel();
    testSymlinksAreNotFollowed();
    testUnreadableDirectoryCountsAsEmpty();
    testCancelBeforeStart();
    testCancelMidScanThenRescan();
    testProgressIsMonotonic();
    return TestSupport::finish("scan engine");
}
