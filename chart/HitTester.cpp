// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <cmath>
#include <numbers>
#include "HitTester.h"

namespace HitTester {

    PolarPoint toPolar(double x, double y, double centerX, double centerY, double chartRadius) {
        const double dx = x - centerX;
        const double dy = y - centerY;

        PolarPoint point;
        point.radius = chartRadius > 0.0 ? std::sqrt(dx * dx + dy * dy) / chartRadius : 0.0;

        // atan2 yields (-180, 180]; fold the part above 12 o'clock to the end of the range
        double angle = std::atan2(dy, dx) * 180.0 / std::numbers::pi;
        if (angle < LayoutEngine::kReferenceAngleDeg) {
            angle += 360.0;
        }
        point.angleDeg = angle;

        return point;
    }

    const LayoutEngine::SliceGeometry* locateSlice(const PolarPoint& point,
                                                   const std::vector<LayoutEngine::Ring>& rings,
                                                   const LayoutEngine::LayoutOptions& options) {
        for (size_t ringIndex = 0; ringIndex < rings.size(); ++ringIndex) {
            const double inner = LayoutEngine::ringInnerRadius(ringIndex, rings.size(), options);
            const double outer = LayoutEngine::ringOuterRadius(ringIndex, rings.size(), options);
            if (point.radius < inner || point.radius > outer) {
                continue;
            }

            for (const auto& slice : rings[ringIndex]) {
                if (point.angleDeg >= slice.startAngleDeg && point.angleDeg < slice.endAngleDeg) {
                    return &slice;
                }
            }

            // Gap in the ring under the pointer (skipped thin or empty parent)
            return nullptr;
        }
        return nullptr;
    }

    const FileSystemEntry* locate(const PolarPoint& point,
                                  const std::vector<LayoutEngine::Ring>& rings,
                                  const LayoutEngine::LayoutOptions& options) {
        const LayoutEngine::SliceGeometry* slice = locateSlice(point, rings, options);
        return slice ? slice->node : nullptr;
    }
}
