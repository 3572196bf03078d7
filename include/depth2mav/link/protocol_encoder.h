#pragma once

#include <cstdint>
#include <utility>

#include "depth2mav/link/mavlink_msgs.h"
#include "depth2mav/types.h"

namespace depth2mav::link {

// Builds the two per-snapshot reports. Stateless; never fails for a validated geometry.
class ProtocolEncoder {
public:
  ProtocolEncoder(const SectorGeometry& geometry, const RangeBounds& bounds);

  mavlink_obstacle_distance_t sector_report(const Snapshot& snap) const;
  mavlink_distance_sensor_t single_point_report(const Snapshot& snap) const;

  // Distance as it goes on the wire: anything outside [min_cm, sentinel] becomes the sentinel.
  uint16_t clamp_cm(uint32_t cm) const;

  // Inclusive range of sectors averaged for the single-point report (33..37 for 72 sectors).
  std::pair<int, int> center_window(int sector_count) const;

private:
  SectorGeometry geometry_;
  RangeBounds bounds_;
};

} // namespace depth2mav::link
