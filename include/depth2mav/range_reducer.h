#pragma once

#include <utility>

#include "depth2mav/types.h"

namespace depth2mav {

// Column span [first, last) of sector i on an image `width` pixels wide.
// Always nonempty and inside [0, width - 1].
std::pair<int, int> sector_columns(int width, int sector_count, int i);

// Fold the center row of a depth image into one distance per sector (cm).
// `out` is resized to geometry.sector_count; reuse it across frames to avoid allocation.
// Sectors whose mean depth is <= 0 or outside bounds get bounds.sentinel_cm().
void reduce(const DepthMatrix& depth, double depth_scale,
            const RangeBounds& bounds, const SectorGeometry& geometry,
            DistanceArray& out);

DistanceArray reduce(const DepthImage& image, const RangeBounds& bounds,
                     const SectorGeometry& geometry);

} // namespace depth2mav
