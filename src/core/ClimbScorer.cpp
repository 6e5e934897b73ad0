#include "core/ClimbScorer.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

double ClimbScorer::max_gradient_in(const ClimbSpan &span) const {
  // grads_ is ordered by from_idx
  auto it = std::lower_bound(
      grads_.begin(), grads_.end(), span.start_idx,
      [](const GradientSample &g, std::size_t idx) { return g.from_idx < idx; });

  double best = -std::numeric_limits<double>::infinity();
  for (; it != grads_.end() && it->to_idx <= span.end_idx; ++it)
    best = std::max(best, it->gradient_pct);
  return std::isfinite(best) ? best : 0.0;
}

Climb ClimbScorer::measure(const ClimbSpan &span) const {
  const auto &pts = profile_.points;
  if (span.end_idx >= pts.size() || span.start_idx >= span.end_idx)
    throw InvalidInputError("climb span out of range");

  const auto &a = pts[span.start_idx];
  const auto &b = pts[span.end_idx];

  Climb c;
  c.start_idx = span.start_idx;
  c.end_idx = span.end_idx;
  c.start_distance_m = a.distance_m;
  c.end_distance_m = b.distance_m;
  c.start_elevation_m = a.elevation_m;
  c.end_elevation_m = b.elevation_m;
  c.length_m = b.distance_m - a.distance_m;
  c.elevation_gain_m = b.elevation_m - a.elevation_m;
  c.avg_gradient_pct =
      c.length_m > 0.0 ? 100.0 * c.elevation_gain_m / c.length_m : 0.0;
  c.max_gradient_pct = max_gradient_in(span);
  return c;
}

void ClimbScorer::score(Climb &c) const {
  c.avg_gradient_pct =
      c.length_m > 0.0 ? 100.0 * c.elevation_gain_m / c.length_m : 0.0;
  c.difficulty_score = c.elevation_gain_m * c.avg_gradient_pct;
}
