// Copyright (c) 2025, depth2mav contributors.
// All rights reserved.

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include "depth2mav/types.h"

namespace depth2mav {

// Latest obstacle map, handed from the frame loop to the telemetry scheduler.
//
// The writer fills a private back buffer without holding the lock and then
// swaps it with the visible snapshot; the lock only covers the swap and the
// readers' copy-out. A reader therefore always gets one whole snapshot, either
// the one before or the one after a concurrent publish.
class SharedSnapshot {
public:
  // producer: frame loop. Concurrent publishers are serialized.
  void publish(const DistanceArray& distances, uint64_t stamp_us);

  // consumer: empty until the first publish, otherwise a private copy
  std::optional<Snapshot> read() const;

  // number of publishes so far
  uint64_t sequence() const;

private:
  std::mutex writer_mutex_;
  Snapshot back_;             // owned by the writer between publishes

  mutable std::mutex mutex_;
  Snapshot front_;
  bool has_value_ = false;
  uint64_t seq_ = 0;
};

} // namespace depth2mav
