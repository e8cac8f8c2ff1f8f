// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_HITTESTER_H
#define RINGDU_HITTESTER_H

#include <vector>
#include "LayoutEngine.h"

namespace HitTester {

    /**
     * A pointer position relative to the chart center.
     * radius is normalized (0 = center, 1 = chart edge), angleDeg is in the
     * layout's frame: -90 at 12 o'clock, growing clockwise, in [-90, 270).
     */
    struct PolarPoint {
        double radius = 0.0;
        double angleDeg = 0.0;
    };

    /**
     * Converts a screen position (y grows downwards) into chart polar coordinates.
     *
     * @param chartRadius Radius of the chart in the same units as x and y,
     *                    usually half the smaller side of the canvas.
     */
    [[nodiscard]] PolarPoint toPolar(double x, double y, double centerX, double centerY, double chartRadius);

    /**
     * Finds the slice under a point.
     *
     * The first ring whose radius band contains the point is searched for a slice
     * with startAngle <= angle < endAngle. If that ring has no slice there the
     * result is null; other rings are not consulted.
     */
    const LayoutEngine::SliceGeometry* locateSlice(const PolarPoint& point,
                                                   const std::vector<LayoutEngine::Ring>& rings,
                                                   const LayoutEngine::LayoutOptions& options = {});

    const FileSystemEntry* locate(const PolarPoint& point,
                                  const std::vector<LayoutEngine::Ring>& rings,
                                  const LayoutEngine::LayoutOptions& options = {});
}

#endif //RINGDU_HITTESTER_H
