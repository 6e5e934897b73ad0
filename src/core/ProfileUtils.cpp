#include "core/ProfileUtils.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

void ProfileUtils::validate(const ElevationProfile &profile) {
  const auto &pts = profile.points;
  if (pts.size() < 2)
    throw InvalidInputError("profile needs at least 2 points, got " +
                            std::to_string(pts.size()));

  double last = 0.0;
  for (std::size_t i = 0; i < pts.size(); ++i) {
    const auto &p = pts[i];
    if (!std::isfinite(p.distance_m) || !std::isfinite(p.elevation_m))
      throw InvalidInputError("non-finite value at point " +
                              std::to_string(i));
    if (p.distance_m < 0.0)
      throw InvalidInputError("negative distance at point " +
                              std::to_string(i));
    if (i > 0 && p.distance_m < last)
      throw InvalidInputError("distance decreases at point " +
                              std::to_string(i));
    last = p.distance_m;
  }
}

std::vector<double> ProfileUtils::smooth(const ElevationProfile &profile,
                                         int window) {
  const auto &pts = profile.points;
  const std::size_t n = pts.size();
  std::vector<double> out;
  out.reserve(n);
  if (window <= 1) {
    for (const auto &p : pts)
      out.push_back(p.elevation_m);
    return out;
  }

  const std::size_t half = static_cast<std::size_t>(window / 2);
  for (std::size_t i = 0; i < n; ++i) {
    // shrink symmetrically so no read falls outside [0, n)
    const std::size_t k = std::min({half, i, n - 1 - i});
    double sum = 0.0;
    for (std::size_t j = i - k; j <= i + k; ++j)
      sum += pts[j].elevation_m;
    out.push_back(sum / static_cast<double>(2 * k + 1));
  }
  return out;
}

ElevationProfile
ProfileUtils::with_elevations(const ElevationProfile &profile,
                              const std::vector<double> &elev) {
  if (elev.size() != profile.size())
    throw InvalidInputError("elevation series does not match profile length");
  ElevationProfile out;
  out.points.reserve(profile.size());
  for (std::size_t i = 0; i < profile.size(); ++i)
    out.points.push_back({profile.points[i].distance_m, elev[i]});
  return out;
}

// gradient in percent: (elev[i+1]-elev[i]) / (dist[i+1]-dist[i]) * 100
std::vector<GradientSample>
ProfileUtils::gradients(const ElevationProfile &profile) {
  const auto &pts = profile.points;
  std::vector<GradientSample> out;
  if (pts.size() < 2)
    return out;
  out.reserve(pts.size() - 1);

  for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
    const double ds = pts[i + 1].distance_m - pts[i].distance_m;
    if (!(ds > 0.0))
      continue; // duplicate point, no distance contribution
    GradientSample g;
    g.from_idx = i;
    g.to_idx = i + 1;
    g.distance_m = pts[i].distance_m + 0.5 * ds;
    g.length_m = ds;
    g.gradient_pct =
        (pts[i + 1].elevation_m - pts[i].elevation_m) / ds * 100.0;
    out.push_back(g);
  }
  return out;
}

RouteSummary ProfileUtils::summarize(const ElevationProfile &profile) {
  RouteSummary s;
  const auto &pts = profile.points;
  s.point_count = pts.size();
  if (pts.empty())
    return s;

  s.total_distance_m = pts.back().distance_m - pts.front().distance_m;
  s.min_elevation_m = pts.front().elevation_m;
  s.max_elevation_m = pts.front().elevation_m;
  for (std::size_t i = 1; i < pts.size(); ++i) {
    const double diff = pts[i].elevation_m - pts[i - 1].elevation_m;
    if (diff > 0)
      s.total_ascent_m += diff;
    else
      s.total_descent_m -= diff;
    s.min_elevation_m = std::min(s.min_elevation_m, pts[i].elevation_m);
    s.max_elevation_m = std::max(s.max_elevation_m, pts[i].elevation_m);
  }
  return s;
}

std::vector<std::size_t>
ProfileUtils::sample_indices_along_distance(const ElevationProfile &profile,
                                            double interval_m) {
  if (!(interval_m > 0.0) || !std::isfinite(interval_m))
    throw InvalidConfigError("sampling interval must be > 0");

  std::vector<std::size_t> idx;
  const auto &pts = profile.points;
  if (pts.empty())
    return idx;

  const double origin = pts.front().distance_m;
  const double total = pts.back().distance_m - origin;
  if (total <= 0.0)
    return {0};

  // one pass over the points; k is the next multiple still to be reached
  idx.push_back(0);
  double k = 1.0;
  for (std::size_t i = 1; i < pts.size(); ++i) {
    const double d = pts[i].distance_m;
    if (origin + k * interval_m > d)
      continue;
    idx.push_back(i);
    k = std::floor((d - origin) / interval_m) + 1.0;
  }
  return idx;
}
