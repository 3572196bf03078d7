// Copyright (c) 2025, depth2mav contributors.
// All rights reserved.

#pragma once

#include <cmath>
#include <cstdint>
#include <vector>

#include <eigen3/Eigen/Dense>

namespace depth2mav {

// raw z16 samples, row-major (height x width)
using DepthMatrix = Eigen::Matrix<uint16_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

struct DepthImage {
  DepthMatrix data;
  float depth_scale = 0.f;   // meters per raw unit
  uint64_t seq = 0;          // source frame number
  uint64_t stamp_us = 0;     // capture time, microseconds since epoch; 0 if unknown

  int width() const { return int(data.cols()); }
  int height() const { return int(data.rows()); }
};

// Angular layout of the obstacle map. Sector 0 is the leftmost slice.
struct SectorGeometry {
  int sector_count = 72;
  float hfov_deg = 87.f;

  float increment_deg() const { return hfov_deg / float(sector_count); }
  float angle_offset_deg() const { return -(hfov_deg / 2.f); }
};

struct RangeBounds {
  double min_m = 0.1;
  double max_m = 8.0;

  uint16_t min_cm() const { return uint16_t(std::lround(min_m * 100.0)); }
  uint16_t max_cm() const { return uint16_t(std::lround(max_m * 100.0)); }
  // "nothing within range" marker
  uint16_t sentinel_cm() const { return uint16_t(max_cm() + 1); }
};

// one entry per sector, centimeters
using DistanceArray = std::vector<uint16_t>;

struct Snapshot {
  DistanceArray distances;
  uint64_t stamp_us = 0;   // capture time of the source frame
  uint64_t seq = 0;        // publish counter, starts at 1
};

} // namespace depth2mav
