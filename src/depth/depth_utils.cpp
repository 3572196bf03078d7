#include "depth2mav/depth/depth_utils.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace { // internal helpers

using depth2mav::DepthMatrix;
using depth2mav::depth::WorkMatrix;

// blend `cur` toward `ref` when both are valid and close enough
inline void blend(float& cur, float ref, float alpha, float delta) {
  if (cur > 0.f && ref > 0.f && std::fabs(cur - ref) < delta) {
    cur = alpha * cur + (1.f - alpha) * ref;
  }
}

inline void invert_nonzero(WorkMatrix& img, float scale) {
  for (Eigen::Index i = 0; i < img.size(); ++i) {
    float& v = img.data()[i];
    v = (v > 0.f) ? scale / v : 0.f;
  }
}

const char kPixels[] = " .:nhBXWW";
constexpr int kPixelCount = int(sizeof(kPixels)) - 1;

} // anon

namespace depth2mav::depth {

HoleFillMode hole_fill_mode_from_string(const std::string& name)
{
  if (name == "fill_from_left") return HoleFillMode::FillFromLeft;
  if (name == "farthest_from_around") return HoleFillMode::FarthestFromAround;
  if (name == "nearest_from_around") return HoleFillMode::NearestFromAround;
  throw std::invalid_argument("unknown hole filling mode '" + name + "'");
}

// ---------------- decimate ----------------
DepthMatrix decimate(const DepthMatrix& src, int magnitude)
{
  if (magnitude <= 1) return src;

  const int H2 = int(src.rows()) / magnitude;
  const int W2 = int(src.cols()) / magnitude;
  DepthMatrix dst(H2, W2);

  std::vector<uint16_t> block;
  block.reserve(size_t(magnitude) * magnitude);
  for (int y = 0; y < H2; ++y) {
    for (int x = 0; x < W2; ++x) {
      block.clear();
      for (int dy = 0; dy < magnitude; ++dy) {
        for (int dx = 0; dx < magnitude; ++dx) {
          const uint16_t v = src(y * magnitude + dy, x * magnitude + dx);
          if (v != 0) block.push_back(v);
        }
      }
      if (block.empty()) {
        dst(y, x) = 0;
        continue;
      }
      auto mid = block.begin() + block.size() / 2;
      std::nth_element(block.begin(), mid, block.end());
      dst(y, x) = *mid;
    }
  }
  return dst;
}

// ---------------- fill_holes ----------------
void fill_holes(DepthMatrix& img, HoleFillMode mode)
{
  const int H = int(img.rows());
  const int W = int(img.cols());

  if (mode == HoleFillMode::FillFromLeft) {
    for (int y = 0; y < H; ++y) {
      for (int x = 1; x < W; ++x) {
        if (img(y, x) == 0) img(y, x) = img(y, x - 1);
      }
    }
    return;
  }

  const bool farthest = (mode == HoleFillMode::FarthestFromAround);
  // in-place scan: left/top neighbors may already be filled, so holes propagate
  for (int y = 0; y < H; ++y) {
    for (int x = 0; x < W; ++x) {
      if (img(y, x) != 0) continue;

      uint16_t best = 0;
      auto consider = [&](int yy, int xx) {
        if (yy < 0 || yy >= H || xx < 0 || xx >= W) return;
        const uint16_t v = img(yy, xx);
        if (v == 0) return;
        if (best == 0 || (farthest ? v > best : v < best)) best = v;
      };
      consider(y, x - 1);
      consider(y - 1, x);
      consider(y, x + 1);
      consider(y + 1, x);
      img(y, x) = best;
    }
  }
}

// ---------------- disparity ----------------
void to_disparity(WorkMatrix& img, float scale) { invert_nonzero(img, scale); }

void to_depth(WorkMatrix& img, float scale) { invert_nonzero(img, scale); }

// ---------------- spatial ----------------
void spatial_smooth(WorkMatrix& img, float alpha, float delta, int iterations)
{
  const Eigen::Index H = img.rows();
  const Eigen::Index W = img.cols();

  for (int it = 0; it < iterations; ++it) {
    // horizontal: left->right then right->left
    for (Eigen::Index y = 0; y < H; ++y) {
      for (Eigen::Index x = 1; x < W; ++x) blend(img(y, x), img(y, x - 1), alpha, delta);
      for (Eigen::Index x = W - 2; x >= 0; --x) blend(img(y, x), img(y, x + 1), alpha, delta);
    }
    // vertical: top->bottom then bottom->top
    for (Eigen::Index x = 0; x < W; ++x) {
      for (Eigen::Index y = 1; y < H; ++y) blend(img(y, x), img(y - 1, x), alpha, delta);
      for (Eigen::Index y = H - 2; y >= 0; --y) blend(img(y, x), img(y + 1, x), alpha, delta);
    }
  }
}

// ---------------- DepthFilterPipeline ----------------
DepthFilterPipeline::DepthFilterPipeline(const DepthFilterCfg& cfg)
: cfg_(cfg) {}

void DepthFilterPipeline::reset()
{
  temporal_prev_.resize(0, 0);
}

void DepthFilterPipeline::temporal_smooth(WorkMatrix& img)
{
  if (temporal_prev_.rows() != img.rows() || temporal_prev_.cols() != img.cols()) {
    temporal_prev_ = img;
    return;
  }
  for (Eigen::Index i = 0; i < img.size(); ++i) {
    blend(img.data()[i], temporal_prev_.data()[i], cfg_.temporal_alpha, cfg_.temporal_delta);
  }
  temporal_prev_ = img;
}

DepthImage DepthFilterPipeline::process(const DepthImage& in)
{
  DepthImage out;
  out.depth_scale = in.depth_scale;
  out.seq = in.seq;
  out.stamp_us = in.stamp_us;

  if (cfg_.decimation) {
    out.data = decimate(in.data, cfg_.decimation_magnitude);
  } else {
    out.data = in.data;
  }

  if (cfg_.disparity_domain || cfg_.spatial || cfg_.temporal) {
    work_ = out.data.cast<float>();
    if (cfg_.disparity_domain) to_disparity(work_, cfg_.disparity_scale);
    if (cfg_.spatial) spatial_smooth(work_, cfg_.spatial_alpha, cfg_.spatial_delta, cfg_.spatial_iterations);
    if (cfg_.temporal) temporal_smooth(work_);
    if (cfg_.disparity_domain) to_depth(work_, cfg_.disparity_scale);
    out.data = work_.cwiseMax(0.f).cwiseMin(65535.f).array().round().cast<uint16_t>().matrix();
  }

  if (cfg_.hole_filling) fill_holes(out.data, cfg_.hole_fill_mode);
  return out;
}

std::vector<std::string> DepthFilterPipeline::active_stages() const
{
  std::vector<std::string> names;
  if (cfg_.decimation) names.emplace_back("decimation");
  if (cfg_.disparity_domain) names.emplace_back("depth_to_disparity");
  if (cfg_.spatial) names.emplace_back("spatial");
  if (cfg_.temporal) names.emplace_back("temporal");
  if (cfg_.disparity_domain) names.emplace_back("disparity_to_depth");
  if (cfg_.hole_filling) names.emplace_back("hole_filling");
  return names;
}

// ---------------- depth_text_image ----------------
std::string depth_text_image(const DepthImage& img, const TextImageCfg& cfg)
{
  const int wr = std::max(1, cfg.width_ratio);
  const int hr = std::max(1, cfg.height_ratio);
  const int row_len = img.width() / wr;
  const int divisor = std::max(1, (hr * wr) / (kPixelCount - 1));

  std::string txt;
  std::vector<int> coverage(row_len, 0);
  for (int y = 0; y < img.height(); ++y) {
    for (int x = 0; x < row_len * wr; ++x) {
      const float dist = img.data(y, x) * img.depth_scale;
      if (0.f < dist && dist < cfg.max_depth_m) coverage[x / wr] += 1;
    }

    if (y % hr == hr - 1) {
      for (int c : coverage) {
        txt += kPixels[std::min(c / divisor, kPixelCount - 1)];
      }
      std::fill(coverage.begin(), coverage.end(), 0);
      txt += '\n';
    }
  }
  return txt;
}

} // namespace depth2mav::depth
