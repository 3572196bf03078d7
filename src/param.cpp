#include "depth2mav/param.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace depth2mav::param {

po::options_description options()
{
  po::options_description desc("depth2mav: depth camera to MAVLink obstacle distance");
  desc.add_options()
    ("help,h", "produce help message")
    ("config,c", po::value<std::string>(), "YAML configuration file")
    ("connect", po::value<std::string>(), "Vehicle connection target string (serial device, udp:host:port or udpout:host:port)")
    ("baudrate", po::value<double>(), "Vehicle connection baudrate")
    ("obstacle_distance_msg_hz", po::value<double>(), "Update frequency for OBSTACLE_DISTANCE message")
    ("debug", po::bool_switch(), "Enable debug messages");
  return desc;
}

po::variables_map helper(int argc, char** argv)
{
  const auto desc = options();
  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << desc << std::endl;
    std::exit(0);
  }
  return vm;
}

} // namespace depth2mav::param
