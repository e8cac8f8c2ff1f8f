// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_LAYOUTENGINE_H
#define RINGDU_LAYOUTENGINE_H

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <vector>
#include "../FileSystemEntry.h"

namespace LayoutEngine {

    // Ring 0 starts at 12 o'clock. Angles grow clockwise in screen coordinates.
    inline constexpr double kReferenceAngleDeg = -90.0;

    struct LayoutOptions {
        int baseDepth = 3;          // Rings built without explicit expansion
        int maxRings = 10;          // Hard cap for pathological depth
        double minArcDeg = 0.5;     // Thinner parents are not subdivided
        int paletteSize = 12;

        // Radii are normalized: 0 is the chart center, 1 its outer edge
        double centerRadius = 0.18;
        double outerPadding = 0.02;

        double maxOpacity = 1.0;
        double minOpacity = 0.4;
        double opacityStep = 0.15;
    };

    struct SliceGeometry {
        const FileSystemEntry* node = nullptr;
        int ringIndex = 0;
        double startAngleDeg = 0.0;
        double endAngleDeg = 0.0;
        int depth = 0;
        int colorIndex = 0;
        double opacity = 1.0;

        [[nodiscard]] double arcDeg() const { return endAngleDeg - startAngleDeg; }
    };

    using Ring = std::vector<SliceGeometry>;
    using ExpandedSet = std::unordered_set<uint64_t>;

    /**
     * Lays out the focused node's descendants as concentric rings.
     *
     * Ring 0 divides the full circle among the focused node's children. Every
     * further ring divides each parent slice's arc among that parent's children in
     * proportion to their sizes. Rings below options.baseDepth are always built;
     * deeper rings only subdivide parents whose id is in expandedIds.
     *
     * The result only depends on the arguments: the same tree, focus and
     * expansion set always produce identical geometry.
     *
     * @param focus The node at the center of the chart.
     * @param expandedIds Ids of the nodes allowed to open a ring past the base depth.
     * @param options Depth limits, palette and radii.
     * @return Rings ordered from the center outwards, slices ordered by angle
     *         within each parent. Empty if the focus has nothing to show.
     */
    std::vector<Ring> buildRings(const FileSystemEntry& focus,
                                 const ExpandedSet& expandedIds,
                                 const LayoutOptions& options = {});

    /**
     * Slices for one parent's children, placed in [startAngleDeg, startAngleDeg + arcDeg).
     * Returns nothing if the children's total size is zero.
     */
    Ring buildSlicesInArc(const std::vector<FileSystemEntry>& nodes,
                          double startAngleDeg,
                          double arcDeg,
                          int depth,
                          const SliceGeometry* parent,
                          const LayoutOptions& options);

    [[nodiscard]] double opacityForDepth(int depth, const LayoutOptions& options);

    /**
     * Normalized radial thickness of one ring. Fewer rings than the base depth still
     * leave room for the base depth so the chart does not jump in size.
     */
    [[nodiscard]] double ringWidth(size_t ringCount, const LayoutOptions& options);
    [[nodiscard]] double ringInnerRadius(size_t ringIndex, size_t ringCount, const LayoutOptions& options);
    [[nodiscard]] double ringOuterRadius(size_t ringIndex, size_t ringCount, const LayoutOptions& options);

    /**
     * Removes a node and every id beneath it from the expansion set, including
     * descendants that were expanded on their own.
     */
    void collapse(ExpandedSet& expandedIds, const FileSystemEntry& node);
}

#endif //RINGDU_LAYOUTENGINE_H
