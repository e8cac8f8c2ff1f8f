// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <atomic>
#include <memory>
#include "ChartViewState.h"
#include "Utils.h"
#include "scanners/DirectoryScannerEngine.h"
#include "TestSupport.h"

using TestSupport::expect;
using TestSupport::near;

namespace {

// Scan, annotate, lay out and hit test one small tree on disk:
//   root/a.txt      100 bytes
//   root/sub/b.txt  300 bytes
void testScanToChart() {
    TestSupport::TempDir dir("end_to_end");
    dir.writeFile("a.txt", 100);
    dir.writeFile("sub/b.txt", 300);

    DirectoryScannerEngine::ScanOptions options;
    options.sizeMode = DirectoryScannerEngine::SizeMode::Logical;

    std::atomic<bool> cancel{false};
    auto result = DirectoryScannerEngine::scanTree(dir.path().string(), cancel, options);
    expect(result.status == DirectoryScannerEngine::ScanStatus::Completed && result.root, "scan completes");
    if (!result.root) {
        return;
    }

    auto root = std::make_shared<FileSystemEntry>(std::move(*result.root));
    annotatePercentages(*root);

    ChartViewState view;
    view.setRoot(root);

    const auto rings = view.rings();
    expect(rings.size() == 2, "directory child opens a second ring");
    if (rings.size() != 2 || rings[0].size() != 2) {
        expect(false, "ring 0 holds two slices");
        return;
    }

    const auto& sub = rings[0][0];
    const auto& a = rings[0][1];
    expect(sub.node->name == "sub" && a.node->name == "a.txt", "larger entry comes first");
    expect(near(sub.arcDeg(), 270.0), "sub spans three quarters");
    expect(near(a.arcDeg(), 90.0), "a.txt spans one quarter");
    expect(near(sub.node->percentageOfTotal, 75.0) && near(a.node->percentageOfTotal, 25.0), "percentages");

    expect(rings[1].size() == 1 && rings[1][0].node->name == "b.txt", "b.txt sits above sub");
    expect(near(rings[1][0].arcDeg(), 270.0), "only child fills its parent's arc");

    // On an 800x800 canvas ring 0 spans radii 72..178.7 pixels. a.txt covers [180, 270),
    // which is the upper left quadrant.
    const double r = 0.313 * 400;
    const FileSystemEntry* hit = view.nodeAt(400 - r * 0.7071, 400 - r * 0.7071, 800, 800);
    expect(hit == a.node, "upper left of ring 0 is a.txt");
    expect(view.nodeAt(400 + r, 400, 800, 800) == sub.node, "3 o'clock of ring 0 is sub");

    expect(Utils::entryKind(*sub.node) == QStringLiteral("folder"), "directories are folders");
    expect(Utils::formatPercentage(sub.node->percentageOfTotal) == QStringLiteral("75.0%"), "percentage label");

    // Drilling into sub puts b.txt in ring 0 with the full circle
    expect(view.drillDown(*sub.node), "drill into sub");
    const auto subRings = view.rings();
    expect(subRings.size() == 1 && subRings[0].size() == 1 && near(subRings[0][0].arcDeg(), 360.0),
           "single child of the focus fills the circle");
}

}  // namespace

int main() {
    testScanToChart();
    return TestSupport::finish("end to end");
}
