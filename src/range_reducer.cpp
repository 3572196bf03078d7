#include "depth2mav/range_reducer.h"

#include <algorithm>
#include <cmath>

namespace depth2mav {

std::pair<int, int> sector_columns(int width, int sector_count, int i)
{
  const double step = double(width) / double(sector_count);

  double lower = i * step - step / 2;
  if (lower < 0) lower = 0;
  double upper = i * step + step / 2;
  if (upper > width - 1) upper = width - 1;

  const int first = int(lower);
  int last = int(upper);
  // narrow images: truncation can collapse the span at the edges
  if (last <= first) last = std::min(first + 1, width);
  return {first, last};
}

void reduce(const DepthMatrix& depth, double depth_scale,
            const RangeBounds& bounds, const SectorGeometry& geometry,
            DistanceArray& out)
{
  const int n = geometry.sector_count;
  const int width = int(depth.cols());
  const uint16_t sentinel = bounds.sentinel_cm();

  out.resize(n);
  if (width == 0 || depth.rows() == 0) {
    std::fill(out.begin(), out.end(), sentinel);
    return;
  }

  // single center row, not a vertical band
  const auto row = depth.row(depth.rows() / 2);

  for (int i = 0; i < n; ++i) {
    const auto [c0, c1] = sector_columns(width, n, i);
    const double mean_raw = row.segment(c0, c1 - c0).cast<double>().mean();
    const double dist_m = mean_raw * depth_scale;

    if (dist_m <= 0.0 || dist_m < bounds.min_m || dist_m > bounds.max_m) {
      out[i] = sentinel;
    } else {
      out[i] = uint16_t(std::lround(dist_m * 100.0));
    }
  }
}

DistanceArray reduce(const DepthImage& image, const RangeBounds& bounds,
                     const SectorGeometry& geometry)
{
  DistanceArray out;
  reduce(image.data, image.depth_scale, bounds, geometry, out);
  return out;
}

} // namespace depth2mav
