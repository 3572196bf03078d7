#include "depth2mav/link/protocol_encoder.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace depth2mav::link {

namespace {
constexpr int kCenterHalfWidth = 2;
// DISTANCE_SENSOR range, cm
constexpr uint16_t kPointMinCm = 10;
constexpr uint16_t kPointMaxCm = 65;
} // anon

ProtocolEncoder::ProtocolEncoder(const SectorGeometry& geometry, const RangeBounds& bounds)
: geometry_(geometry), bounds_(bounds) {}

uint16_t ProtocolEncoder::clamp_cm(uint32_t cm) const
{
  if (cm < bounds_.min_cm() || cm > bounds_.sentinel_cm()) return bounds_.sentinel_cm();
  return uint16_t(cm);
}

std::pair<int, int> ProtocolEncoder::center_window(int sector_count) const
{
  const int center = sector_count / 2 - 1;
  const int first = std::max(0, center - kCenterHalfWidth);
  const int last = std::min(sector_count - 1, center + kCenterHalfWidth);
  return {first, std::max(first, last)};
}

// https://mavlink.io/en/messages/common.html#OBSTACLE_DISTANCE
mavlink_obstacle_distance_t ProtocolEncoder::sector_report(const Snapshot& snap) const
{
  mavlink_obstacle_distance_t msg{};
  msg.time_usec = snap.stamp_us;
  msg.sensor_type = MAV_DISTANCE_SENSOR_LASER;
  std::fill(std::begin(msg.distances), std::end(msg.distances), kUnusedSector);

  const size_t n = std::min(snap.distances.size(), kMaxSectors);
  for (size_t i = 0; i < n; ++i) {
    msg.distances[i] = clamp_cm(snap.distances[i]);
  }

  msg.min_distance = bounds_.min_cm();
  msg.max_distance = bounds_.max_cm();
  msg.increment_f = geometry_.increment_deg();
  msg.angle_offset = geometry_.angle_offset_deg();
  msg.frame = MAV_FRAME_BODY_FRD;
  return msg;
}

// https://mavlink.io/en/messages/common.html#DISTANCE_SENSOR
mavlink_distance_sensor_t ProtocolEncoder::single_point_report(const Snapshot& snap) const
{
  mavlink_distance_sensor_t msg{};   // timestamp ignored by the receiver, left 0
  msg.min_distance = kPointMinCm;
  msg.max_distance = kPointMaxCm;
  msg.type = MAV_DISTANCE_SENSOR_LASER;
  msg.orientation = MAV_SENSOR_ROTATION_NONE;

  if (snap.distances.empty()) {
    msg.current_distance = bounds_.sentinel_cm();
    return msg;
  }

  const auto [first, last] = center_window(int(snap.distances.size()));
  double sum = 0.0;
  for (int i = first; i <= last; ++i) sum += clamp_cm(snap.distances[i]);
  const double mean = sum / double(last - first + 1);

  msg.current_distance = uint16_t(std::min<long>(std::lround(mean), std::numeric_limits<uint16_t>::max()));
  return msg;
}

} // namespace depth2mav::link
