// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include "LayoutEngine.h"

namespace LayoutEngine {

    double opacityForDepth(int depth, const LayoutOptions& options) {
        return std::max(options.minOpacity, options.maxOpacity - options.opacityStep * static_cast<double>(depth));
    }

    Ring buildSlicesInArc(const std::vector<FileSystemEntry>& nodes,
                          double startAngleDeg,
                          double arcDeg,
                          int depth,
                          const SliceGeometry* parent,
                          const LayoutOptions& options) {
        Ring slices;

        uint64_t total = 0;
        for (const auto& node : nodes) {
            total += node.sizeBytes;
        }
        if (total == 0) {
            return slices;
        }

        const int paletteSize = std::max(1, options.paletteSize);

        // Shift the hue by one per level so that the first child of each parent does
        // not share its neighbour's color
        const int colorOffset = parent ? (parent->colorIndex + 1) % paletteSize : 0;
        const double opacity = opacityForDepth(depth, options);

        slices.reserve(nodes.size());

        double currentAngle = startAngleDeg;
        for (size_t i = 0; i < nodes.size(); ++i) {
            const FileSystemEntry& node = nodes[i];
            const double fraction = static_cast<double>(node.sizeBytes) / static_cast<double>(total);
            const double endAngle = currentAngle + arcDeg * fraction;

            SliceGeometry slice;
            slice.node = &node;
            slice.ringIndex = depth;
            slice.startAngleDeg = currentAngle;
            slice.endAngleDeg = endAngle;
            slice.depth = depth;
            slice.colorIndex = static_cast<int>((i + static_cast<size_t>(colorOffset)) % static_cast<size_t>(paletteSize));
            slice.opacity = opacity;
            slices.push_back(slice);

            currentAngle = endAngle;
        }

        return slices;
    }

    std::vector<Ring> buildRings(const FileSystemEntry& focus,
                                 const ExpandedSet& expandedIds,
                                 const LayoutOptions& options) {
        std::vector<Ring> rings;

        if (!focus.hasChildren() || options.maxRings <= 0) {
            return rings;
        }

        Ring firstRing = buildSlicesInArc(*focus.children, kReferenceAngleDeg, 360.0, 0, nullptr, options);
        if (firstRing.empty()) {
            return rings;
        }
        rings.push_back(std::move(firstRing));

        int depth = 1;
        while (depth < options.maxRings) {
            const Ring& parents = rings.back();
            Ring ring;

            for (const auto& parent : parents) {
                // Past the base depth a parent only opens up when explicitly expanded
                if (depth >= options.baseDepth && !expandedIds.contains(parent.node->id)) {
                    continue;
                }
                if (!parent.node->hasChildren()) {
                    continue;
                }

                const double arc = parent.arcDeg();
                if (arc <= options.minArcDeg) {
                    continue;
                }

                Ring childSlices = buildSlicesInArc(*parent.node->children, parent.startAngleDeg, arc, depth, &parent, options);
                ring.insert(ring.end(), childSlices.begin(), childSlices.end());
            }

            if (ring.empty()) {
                break;
            }

            // push_back may reallocate; `parents` is not used past this point
            rings.push_back(std::move(ring));
            ++depth;
        }

        return rings;
    }

    double ringWidth(size_t ringCount, const LayoutOptions& options) {
        const size_t count = std::max(ringCount, static_cast<size_t>(std::max(1, options.baseDepth)));
        return (1.0 - options.centerRadius - options.outerPadding) / static_cast<double>(count);
    }

    double ringInnerRadius(size_t ringIndex, size_t ringCount, const LayoutOptions& options) {
        return options.centerRadius + ringWidth(ringCount, options) * static_cast<double>(ringIndex);
    }

    double ringOuterRadius(size_t ringIndex, size_t ringCount, const LayoutOptions& options) {
        return options.centerRadius + ringWidth(ringCount, options) * static_cast<double>(ringIndex + 1);
    }

    void collapse(ExpandedSet& expandedIds, const FileSystemEntry& node) {
        expandedIds.erase(node.id);

        if (expandedIds.empty() || !node.children) {
            return;
        }

        for (const auto& child : *node.children) {
            collapse(expandedIds, child);
        }
    }
}
