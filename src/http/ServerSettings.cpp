#include "http/ServerSettings.hpp"
#include "core/Errors.hpp"

#include <cstdint>
#include <fstream>

namespace {

std::vector<std::string> endpoint_list(const Json &j, const char *key) {
  const auto &arr = j[key];
  if (!arr.is_array())
    throw InvalidConfigError(std::string("server.") + key +
                             " must be an array");
  std::vector<std::string> out;
  for (const auto &ep : arr) {
    if (!ep.is_string())
      throw InvalidConfigError(std::string("server.") + key +
                               " must contain strings");
    out.push_back(ep.get<std::string>());
  }
  return out;
}

} // namespace

ServerSettings ServerSettings::from_json(const Json &j) {
  if (!j.is_object())
    throw InvalidConfigError("settings must be a JSON object");

  ServerSettings s;
  if (j.contains("server")) {
    const auto &srv = j["server"];
    if (!srv.is_object())
      throw InvalidConfigError("'server' must be an object");
    try {
      s.host = srv.value("host", s.host);
      s.port = srv.value("port", s.port);
    } catch (const Json::type_error &e) {
      throw InvalidConfigError(std::string("server settings: ") + e.what());
    }
    if (srv.contains("max_points")) {
      const auto &m = srv["max_points"];
      if (!m.is_number_integer())
        throw InvalidConfigError("server.max_points must be an integer");
      const auto v = m.get<std::int64_t>();
      if (v <= 0)
        throw InvalidConfigError("server.max_points must be > 0, got " +
                                 std::to_string(v));
      s.max_points = static_cast<std::size_t>(v);
    }
    if (srv.contains("post_endpoints"))
      s.post_endpoints = endpoint_list(srv, "post_endpoints");
    if (srv.contains("get_endpoints"))
      s.get_endpoints = endpoint_list(srv, "get_endpoints");
  }
  if (s.port <= 0 || s.port > 65535)
    throw InvalidConfigError("server.port out of range: " +
                             std::to_string(s.port));

  if (j.contains("detection"))
    s.detection = DetectionParams::from_json(j["detection"]);
  s.detection.validate();
  return s;
}

ServerSettings ServerSettings::fromFile(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw InvalidConfigError("cannot open " + path);
  Json j;
  try {
    in >> j;
  } catch (const Json::parse_error &e) {
    throw InvalidConfigError(path + ": " + e.what());
  }
  return from_json(j);
}
