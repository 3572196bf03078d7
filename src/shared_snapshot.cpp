#include "depth2mav/shared_snapshot.h"

#include <utility>

namespace depth2mav {

void SharedSnapshot::publish(const DistanceArray& distances, uint64_t stamp_us)
{
  std::lock_guard<std::mutex> writer(writer_mutex_);

  back_.distances.assign(distances.begin(), distances.end());
  back_.stamp_us = stamp_us;

  std::lock_guard<std::mutex> lk(mutex_);
  back_.seq = ++seq_;
  std::swap(front_, back_);
  has_value_ = true;
}

std::optional<Snapshot> SharedSnapshot::read() const
{
  std::lock_guard<std::mutex> lk(mutex_);
  if (!has_value_) return std::nullopt;
  return front_;
}

uint64_t SharedSnapshot::sequence() const
{
  std::lock_guard<std::mutex> lk(mutex_);
  return seq_;
}

} // namespace depth2mav
