#include "depth2mav/config.h"

#include <cmath>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "depth2mav/ipc/depth_shm_protocol.hpp"
#include "depth2mav/link/mavlink_msgs.h"
#include "depth2mav/param.h"

namespace depth2mav {

namespace {

template <class T>
void read(const YAML::Node& node, const char* key, T& out)
{
  if (node && node[key]) out = node[key].as<T>();
}

void require(bool ok, const std::string& what)
{
  if (!ok) throw ConfigError(what);
}

} // anon

// ---------------- validate ----------------
void Config::validate() const
{
  require(geometry.sector_count > 0, "geometry.sector_count must be positive");
  require(size_t(geometry.sector_count) <= link::kMaxSectors,
          "geometry.sector_count must be at most 72");
  require(geometry.hfov_deg > 0.f && geometry.hfov_deg < 360.f, "geometry.hfov_deg must be in (0, 360)");

  require(bounds.min_m >= 0.0, "geometry.min_range_m must not be negative");
  require(bounds.min_m < bounds.max_m, "geometry.min_range_m must be below max_range_m");
  require(bounds.max_m * 100.0 + 1.0 < 65535.0, "geometry.max_range_m does not fit in 16-bit centimeters");

  require(camera.width > 0 && camera.height > 0, "camera resolution must be positive");
  require(camera.width <= int(ipc::kMaxW) && camera.height <= int(ipc::kMaxH), "camera resolution exceeds 1280x720");
  require(camera.fps > 0, "camera.fps must be positive");
  require(camera.frame_timeout_s > 0.0, "camera.frame_timeout_s must be positive");
  require(camera.disconnect_timeout_s >= camera.frame_timeout_s,
          "camera.disconnect_timeout_s must be at least frame_timeout_s");

  if (filters.decimation) {
    require(filters.decimation_magnitude >= 2 && filters.decimation_magnitude <= 8,
            "filters.decimation_magnitude must be in [2, 8]");
  }
  const int effective_width = filters.decimation ? camera.width / filters.decimation_magnitude : camera.width;
  require(effective_width >= geometry.sector_count, "filtered image is narrower than sector_count");
  if (filters.spatial) {
    require(filters.spatial_alpha > 0.f && filters.spatial_alpha <= 1.f, "filters.spatial_alpha must be in (0, 1]");
    require(filters.spatial_delta > 0.f, "filters.spatial_delta must be positive");
    require(filters.spatial_iterations >= 1 && filters.spatial_iterations <= 5,
            "filters.spatial_iterations must be in [1, 5]");
  }
  if (filters.temporal) {
    require(filters.temporal_alpha > 0.f && filters.temporal_alpha <= 1.f, "filters.temporal_alpha must be in (0, 1]");
    require(filters.temporal_delta > 0.f, "filters.temporal_delta must be positive");
  }
  if (filters.disparity_domain) {
    require(filters.disparity_scale > 0.f, "filters.disparity_scale must be positive");
  }

  require(!link.connection.empty(), "link.connection must not be empty");
  require(link.baudrate > 0, "link.baudrate must be positive");
  require(link.timeout_s > 0.0, "link.timeout_s must be positive");
  require(link.source_system >= 1 && link.source_system <= 255, "link.source_system must be in [1, 255]");
  require(link.source_component >= 0 && link.source_component <= 255, "link.source_component must be in [0, 255]");

  require(telemetry.obstacle_distance_msg_hz > 0.0, "telemetry.obstacle_distance_msg_hz must be positive");

  require(debug.text_image.width_ratio > 0 && debug.text_image.height_ratio > 0,
          "debug text image ratios must be positive");
}

// ---------------- YAML ----------------
Config config_from_yaml(const YAML::Node& root)
{
  Config cfg;
  try {
    const auto cam = root["camera"];
    read(cam, "shm_name", cfg.camera.shm_name);
    read(cam, "width", cfg.camera.width);
    read(cam, "height", cfg.camera.height);
    read(cam, "fps", cfg.camera.fps);
    read(cam, "frame_timeout_s", cfg.camera.frame_timeout_s);
    read(cam, "disconnect_timeout_s", cfg.camera.disconnect_timeout_s);

    const auto geo = root["geometry"];
    read(geo, "sector_count", cfg.geometry.sector_count);
    read(geo, "hfov_deg", cfg.geometry.hfov_deg);
    read(geo, "min_range_m", cfg.bounds.min_m);
    read(geo, "max_range_m", cfg.bounds.max_m);

    const auto flt = root["filters"];
    read(flt, "decimation", cfg.filters.decimation);
    read(flt, "decimation_magnitude", cfg.filters.decimation_magnitude);
    read(flt, "disparity_domain", cfg.filters.disparity_domain);
    read(flt, "disparity_scale", cfg.filters.disparity_scale);
    read(flt, "spatial", cfg.filters.spatial);
    read(flt, "spatial_alpha", cfg.filters.spatial_alpha);
    read(flt, "spatial_delta", cfg.filters.spatial_delta);
    read(flt, "spatial_iterations", cfg.filters.spatial_iterations);
    read(flt, "temporal", cfg.filters.temporal);
    read(flt, "temporal_alpha", cfg.filters.temporal_alpha);
    read(flt, "temporal_delta", cfg.filters.temporal_delta);
    read(flt, "hole_filling", cfg.filters.hole_filling);
    if (flt && flt["hole_fill_mode"]) {
      cfg.filters.hole_fill_mode = depth::hole_fill_mode_from_string(flt["hole_fill_mode"].as<std::string>());
    }

    const auto lnk = root["link"];
    read(lnk, "connection", cfg.link.connection);
    read(lnk, "baudrate", cfg.link.baudrate);
    read(lnk, "timeout_s", cfg.link.timeout_s);
    read(lnk, "source_system", cfg.link.source_system);
    read(lnk, "source_component", cfg.link.source_component);

    const auto tel = root["telemetry"];
    read(tel, "enable_obstacle_distance", cfg.telemetry.enable_obstacle_distance);
    read(tel, "enable_distance_sensor", cfg.telemetry.enable_distance_sensor);
    read(tel, "obstacle_distance_msg_hz", cfg.telemetry.obstacle_distance_msg_hz);

    const auto home = root["home"];
    read(home, "auto_set", cfg.home.auto_set);
    read(home, "lat", cfg.home.location.latitude);
    read(home, "lon", cfg.home.location.longitude);
    read(home, "alt", cfg.home.location.altitude);

    const auto dbg = root["debug"];
    read(dbg, "enable", cfg.debug.enable);
    read(dbg, "width_ratio", cfg.debug.text_image.width_ratio);
    read(dbg, "height_ratio", cfg.debug.text_image.height_ratio);
    read(dbg, "max_txt_depth_m", cfg.debug.text_image.max_depth_m);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("bad configuration value: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
  return cfg;
}

// ---------------- load_config ----------------
Config load_config(const boost::program_options::variables_map& vm)
{
  std::filesystem::path path;
  if (vm.count("config")) {
    path = vm["config"].as<std::string>();
  } else if (std::filesystem::exists(param::kDefaultConfigPath)) {
    path = param::kDefaultConfigPath;
  }

  Config cfg;
  if (!path.empty()) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
      throw ConfigError("cannot load " + path.string() + ": " + e.what());
    }
    cfg = config_from_yaml(root);
    spdlog::info("Loaded configuration from {}", path.string());
  } else {
    spdlog::info("No configuration file, using built-in defaults");
  }

  if (vm.count("connect")) {
    cfg.link.connection = vm["connect"].as<std::string>();
    spdlog::info("Using connection_string {}", cfg.link.connection);
  } else {
    spdlog::info("Using default connection_string {}", cfg.link.connection);
  }

  if (vm.count("baudrate")) {
    cfg.link.baudrate = int(std::lround(vm["baudrate"].as<double>()));
    spdlog::info("Using connection_baudrate {}", cfg.link.baudrate);
  } else {
    spdlog::info("Using default connection_baudrate {}", cfg.link.baudrate);
  }

  if (vm.count("obstacle_distance_msg_hz")) {
    cfg.telemetry.obstacle_distance_msg_hz = vm["obstacle_distance_msg_hz"].as<double>();
    spdlog::info("Using obstacle_distance_msg_hz {}", cfg.telemetry.obstacle_distance_msg_hz);
  } else {
    spdlog::info("Using default obstacle_distance_msg_hz {}", cfg.telemetry.obstacle_distance_msg_hz);
  }

  if (vm.count("debug") && vm["debug"].as<bool>()) cfg.debug.enable = true;

  cfg.validate();
  return cfg;
}

} // namespace depth2mav
