#pragma once

#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <cstddef>
#include <string>
#include <vector>

// Contents of config/settings.json.
//
// {
//   "server": {"host": "0.0.0.0", "port": 5005, "max_points": 200000,
//              "post_endpoints": ["/climbs", ...],
//              "get_endpoints": ["/params", ...]},
//   "detection": { DetectionParams keys }
// }
struct ServerSettings {
  std::string host = "0.0.0.0";
  int port = 5005;
  std::size_t max_points = 200000;
  std::vector<std::string> post_endpoints = {"/climbs", "/sample", "/debug"};
  std::vector<std::string> get_endpoints = {"/params", "/categories",
                                            "/health"};
  DetectionParams detection;

  // Throws InvalidConfigError for bad shapes or invalid detection defaults.
  static ServerSettings from_json(const Json &j);
  static ServerSettings fromFile(const std::string &path);
};
