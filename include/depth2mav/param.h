// Copyright (c) 2025, depth2mav contributors.
// All rights reserved.

#pragma once

#include <filesystem>

#include <boost/program_options.hpp>

namespace depth2mav::param {

namespace po = boost::program_options;

inline const std::filesystem::path kDefaultConfigPath = "config/depth2mav.yaml";

po::options_description options();

// Parses argv; prints usage and exits on --help.
po::variables_map helper(int argc, char** argv);

} // namespace depth2mav::param
