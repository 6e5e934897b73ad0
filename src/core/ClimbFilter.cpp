#include "core/ClimbFilter.hpp"

#include <algorithm>

bool ClimbFilter::admits(const Climb &c) const noexcept {
  if (c.elevation_gain_m < L.min_elevation_gain_m)
    return false;
  if (c.avg_gradient_pct < L.min_gradient_pct)
    return false;
  return c.length_m >= L.min_length_m;
}

std::vector<Climb> ClimbFilter::apply(std::vector<Climb> climbs) const {
  climbs.erase(std::remove_if(climbs.begin(), climbs.end(),
                              [this](const Climb &c) { return !admits(c); }),
               climbs.end());
  return climbs;
}
