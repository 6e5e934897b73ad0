#pragma once

#include "core/Errors.hpp"
#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

// Structures decoded from the profile provider's JSON.
//
// Accepted shapes:
//   {"points": [{"distance_m": 0, "elevation_m": 312.4}, ...]}
//   {"distance_m": [...], "elevation_m": [...]}
//   {"distance_km": [...], "elevation_m": [...]}
// Shape errors surface as InvalidInputError; ordering checks are left to the
// detector.

namespace profile_json_detail {

inline double number_field(const Json &j, const char *key) {
  if (!j.contains(key) || !j[key].is_number())
    throw InvalidInputError(std::string("track point needs numeric '") + key +
                            "'");
  return j[key].get<double>();
}

inline std::vector<double> number_array(const Json &j, const char *key) {
  const auto &arr = j[key];
  if (!arr.is_array())
    throw InvalidInputError(std::string("'") + key + "' must be an array");
  std::vector<double> out;
  out.reserve(arr.size());
  for (const auto &v : arr) {
    if (!v.is_number())
      throw InvalidInputError(std::string("'") + key +
                              "' must contain only numbers");
    out.push_back(v.get<double>());
  }
  return out;
}

} // namespace profile_json_detail

// --- TrackPoint ----
inline void from_json(const Json &j, TrackPoint &p) {
  if (!j.is_object())
    throw InvalidInputError("track points must be objects");
  p.distance_m = profile_json_detail::number_field(j, "distance_m");
  p.elevation_m = profile_json_detail::number_field(j, "elevation_m");
}

// --- ElevationProfile ----
inline void from_json(const Json &j, ElevationProfile &profile) {
  if (!j.is_object())
    throw InvalidInputError("profile must be a JSON object");
  profile.points.clear();

  if (j.contains("points")) {
    const auto &pts = j["points"];
    if (!pts.is_array())
      throw InvalidInputError("'points' must be an array");
    profile.points.reserve(pts.size());
    for (const auto &pt : pts)
      profile.points.push_back(pt.get<TrackPoint>());
    return;
  }

  // parallel arrays
  const bool have_m = j.contains("distance_m");
  const bool have_km = j.contains("distance_km");
  if ((!have_m && !have_km) || !j.contains("elevation_m"))
    throw InvalidInputError("profile needs 'points' or distance/elevation "
                            "arrays");

  auto dist = profile_json_detail::number_array(
      j, have_m ? "distance_m" : "distance_km");
  const auto elev = profile_json_detail::number_array(j, "elevation_m");
  if (dist.size() != elev.size())
    throw InvalidInputError("distance and elevation arrays differ in length (" +
                            std::to_string(dist.size()) + " vs " +
                            std::to_string(elev.size()) + ")");
  if (!have_m) {
    for (auto &d : dist)
      d *= 1000.0;
  }

  profile.points.reserve(dist.size());
  for (std::size_t i = 0; i < dist.size(); ++i)
    profile.points.push_back({dist[i], elev[i]});
}

inline void to_json(Json &j, const ElevationProfile &profile) {
  j = Json{{"points", profile.points}};
}
