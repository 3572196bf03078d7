// Copyright (c) 2025, depth2mav contributors.
// All rights reserved.

#pragma once

#include <string>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include "depth2mav/depth/depth_utils.h"
#include "depth2mav/errors.h"
#include "depth2mav/link/vehicle_link.h"
#include "depth2mav/types.h"

namespace depth2mav {

struct CameraCfg {
  std::string shm_name = "/d4xx_depth";
  int width = 640;
  int height = 480;
  int fps = 30;
  double frame_timeout_s = 1.0;        // bounded wait per frame pull
  double disconnect_timeout_s = 5.0;   // no frame for this long -> camera lost
};

struct LinkCfg {
  std::string connection = "/dev/ttyUSB0";
  int baudrate = 921600;
  double timeout_s = 5.0;              // heartbeat wait per connection attempt
  int source_system = 1;
  int source_component = 196;
};

struct TelemetryCfg {
  bool enable_obstacle_distance = true;
  bool enable_distance_sensor = true;
  double obstacle_distance_msg_hz = 15.0;
};

struct HomeCfg {
  bool auto_set = false;               // send EKF origin/home once connected
  link::HomeLocation location;
};

struct DebugCfg {
  bool enable = false;
  depth::TextImageCfg text_image;
};

// Everything read at startup. Never re-read while running.
struct Config {
  CameraCfg camera;
  SectorGeometry geometry;
  RangeBounds bounds;
  depth::DepthFilterCfg filters;
  LinkCfg link;
  TelemetryCfg telemetry;
  HomeCfg home;
  DebugCfg debug;

  // Throws ConfigError naming the first bad field.
  void validate() const;
};

// Missing keys keep their defaults. Throws ConfigError on malformed values.
Config config_from_yaml(const YAML::Node& node);

// YAML file (if any) + command-line overrides, validated.
Config load_config(const boost::program_options::variables_map& vm);

} // namespace depth2mav
