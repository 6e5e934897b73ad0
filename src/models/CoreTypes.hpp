#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <vector>

using Json = nlohmann::json;

// A single sampled point along a route: cumulative distance and elevation.
struct TrackPoint {
  double distance_m = 0.0;  // cumulative distance from point 0, non-decreasing
  double elevation_m = 0.0; // raw elevation (GPS/barometric)
};

// Convenience container for a full route profile. Owned by the caller.
struct ElevationProfile {
  std::vector<TrackPoint> points;

  std::size_t size() const noexcept { return points.size(); }
  bool empty() const noexcept { return points.empty(); }
};

// Per-step gradient between two consecutive (non-duplicate) profile points.
struct GradientSample {
  std::size_t from_idx = 0; // index of the step's first point
  std::size_t to_idx = 0;   // index of the step's last point
  double distance_m = 0.0;  // midpoint of the step
  double length_m = 0.0;    // step length, always > 0
  double gradient_pct = 0.0;
};

// Inclusive range of profile indices flagged as climbing.
struct ClimbSpan {
  std::size_t start_idx = 0;
  std::size_t end_idx = 0;
};

// Whole-route statistics on raw elevation.
struct RouteSummary {
  std::size_t point_count = 0;
  double total_distance_m = 0.0;
  double total_ascent_m = 0.0;
  double total_descent_m = 0.0;
  double min_elevation_m = 0.0;
  double max_elevation_m = 0.0;
};

inline void to_json(Json &j, const TrackPoint &p) {
  j = Json{{"distance_m", p.distance_m}, {"elevation_m", p.elevation_m}};
}

inline void to_json(Json &j, const RouteSummary &s) {
  j = Json{{"point_count", s.point_count},
           {"total_distance_m", s.total_distance_m},
           {"total_ascent_m", s.total_ascent_m},
           {"total_descent_m", s.total_descent_m},
           {"min_elevation_m", s.min_elevation_m},
           {"max_elevation_m", s.max_elevation_m}};
}
