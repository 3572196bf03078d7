#pragma once

#include <string>
#include <vector>

#include "depth2mav/types.h"

namespace depth2mav::depth {

// Same numbering as the RealSense hole_filling_filter "holes_fill" option.
enum class HoleFillMode { FillFromLeft = 0, FarthestFromAround = 1, NearestFromAround = 2 };

// Post-processing chain settings. Stages always run in this order:
// decimation -> depth->disparity -> spatial -> temporal -> disparity->depth -> hole filling
struct DepthFilterCfg {
  bool decimation = false;
  int decimation_magnitude = 4;        // k x k median blocks, 2..8

  // spatial/temporal run on disparity (scale / raw) instead of raw depth
  bool disparity_domain = false;
  float disparity_scale = 65536.f;

  bool spatial = false;
  float spatial_alpha = 0.5f;          // weight of the current sample, (0, 1]
  float spatial_delta = 20.f;          // edge threshold, in working-domain units
  int spatial_iterations = 2;

  bool temporal = false;
  float temporal_alpha = 0.4f;
  float temporal_delta = 20.f;

  bool hole_filling = true;
  HoleFillMode hole_fill_mode = HoleFillMode::FarthestFromAround;
};

HoleFillMode hole_fill_mode_from_string(const std::string& name);

// ---------------- stages (pure) ----------------
DepthMatrix decimate(const DepthMatrix& src, int magnitude);
void fill_holes(DepthMatrix& img, HoleFillMode mode);

using WorkMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
void to_disparity(WorkMatrix& img, float scale);
void to_depth(WorkMatrix& img, float scale);
void spatial_smooth(WorkMatrix& img, float alpha, float delta, int iterations);

// ---------------- pipeline ----------------
class DepthFilterPipeline {
public:
  explicit DepthFilterPipeline(const DepthFilterCfg& cfg = {});

  // Applies the enabled stages. Only the temporal stage keeps history between calls.
  DepthImage process(const DepthImage& in);

  // Names of the enabled stages, in application order.
  std::vector<std::string> active_stages() const;

  void reset();

  const DepthFilterCfg& cfg() const { return cfg_; }

private:
  void temporal_smooth(WorkMatrix& img);

  DepthFilterCfg cfg_;
  WorkMatrix work_;
  WorkMatrix temporal_prev_;
};

// ---------------- debug text rendering ----------------
struct TextImageCfg {
  int width_ratio = 10;     // columns per character
  int height_ratio = 20;    // rows per text line
  float max_depth_m = 1.f;  // count samples closer than this
};

// Coarse ASCII view of how much of each block is covered by near obstacles.
std::string depth_text_image(const DepthImage& img, const TextImageCfg& cfg);

} // namespace depth2mav::depth
