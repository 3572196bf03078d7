#include "depth2mav/app/frame_loop.h"

#include <spdlog/spdlog.h>

#include "depth2mav/range_reducer.h"

namespace depth2mav::app {

namespace {

uint64_t now_us()
{
  using namespace std::chrono;
  return uint64_t(duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

} // anon

FrameLoop::FrameLoop(AppContext& ctx)
: ctx_(ctx),
  pipeline_(ctx.config.filters),
  frame_timeout_(std::chrono::milliseconds(int64_t(ctx.config.camera.frame_timeout_s * 1000.0)))
{
  distances_.reserve(size_t(ctx.config.geometry.sector_count));
  for (const auto& stage : pipeline_.active_stages()) {
    spdlog::info("Applying filter: {}", stage);
  }
}

bool FrameLoop::step()
{
  if (ctx_.shutdown.requested()) return false;

  switch (ctx_.source->next_frame(frame_timeout_, raw_)) {
    case FrameStatus::Timeout:
      return true;
    case FrameStatus::Failure:
      spdlog::critical("Depth camera disconnected");
      ctx_.shutdown_all();
      return false;
    case FrameStatus::Frame:
      break;
  }

  const auto t0 = std::chrono::steady_clock::now();
  // capture time when the source knows it
  const uint64_t stamp_us = raw_.stamp_us != 0 ? raw_.stamp_us : now_us();

  const DepthImage filtered = pipeline_.process(raw_);
  reduce(filtered.data, filtered.depth_scale, ctx_.config.bounds, ctx_.config.geometry, distances_);
  ctx_.snapshot.publish(distances_, stamp_us);
  ++frames_;

  if (ctx_.config.debug.enable) {
    const auto t1 = std::chrono::steady_clock::now();
    spdlog::debug("\n{}", depth::depth_text_image(filtered, ctx_.config.debug.text_image));
    const double proc_s = std::chrono::duration<double>(t1 - t0).count();
    if (last_frame_.time_since_epoch().count() != 0) {
      const double period_s = std::chrono::duration<double>(t0 - last_frame_).count();
      spdlog::debug("Processing time per image: {:.3f} sec, frequency {:.1f} Hz",
                    proc_s, period_s > 0.0 ? 1.0 / period_s : 0.0);
    }
  }
  last_frame_ = t0;
  return true;
}

void FrameLoop::run()
{
  spdlog::info("Frame loop started");
  while (step()) {}
  spdlog::info("Frame loop stopped after {} frames", frames_);
}

} // namespace depth2mav::app
