#pragma once
#include "models/Climb.hpp"
#include <vector>

// Final admission gate for merged climbs.
class ClimbFilter {
public:
  struct Limits {
    double min_elevation_gain_m = 20.0;
    double min_gradient_pct = 3.0;
    double min_length_m = 0.0;
  };

  explicit ClimbFilter(Limits l) : L(l) {}

  bool admits(const Climb &c) const noexcept;
  std::vector<Climb> apply(std::vector<Climb> climbs) const;

private:
  Limits L;
};
