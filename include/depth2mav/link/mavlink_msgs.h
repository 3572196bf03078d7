#pragma once

#include <cstddef>
#include <cstdint>

#include <mavlink/v2.0/common/mavlink.h>

namespace depth2mav::link {

// OBSTACLE_DISTANCE slots; slots past the configured sector count carry kUnusedSector.
constexpr size_t kMaxSectors = MAVLINK_MSG_OBSTACLE_DISTANCE_FIELD_DISTANCES_LEN;
constexpr uint16_t kUnusedSector = UINT16_MAX;

// STATUSTEXT text field, not NUL terminated when full.
constexpr size_t kStatusTextLen = MAVLINK_MSG_STATUSTEXT_FIELD_TEXT_LEN;

} // namespace depth2mav::link
