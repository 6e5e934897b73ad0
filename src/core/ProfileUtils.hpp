#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <vector>

class ProfileUtils {
public:
  // Throws InvalidInputError unless the profile has >= 2 points, finite
  // values, non-negative distances and a non-decreasing distance sequence.
  static void validate(const ElevationProfile &profile);

  // Centered moving average over elevation. Near the ends the window shrinks
  // symmetrically, so the first and last points keep their raw value.
  // window <= 1 returns the raw elevations.
  static std::vector<double> smooth(const ElevationProfile &profile,
                                    int window);

  // Copy of `profile` with its elevations replaced (distances pass through).
  static ElevationProfile with_elevations(const ElevationProfile &profile,
                                          const std::vector<double> &elev);

  // One sample per consecutive pair with a positive step; zero-length steps
  // (duplicate points) are skipped.
  static std::vector<GradientSample> gradients(const ElevationProfile &profile);

  static RouteSummary summarize(const ElevationProfile &profile);

  // First index at or after every multiple of interval_m, sorted and
  // de-duplicated. Linear in the number of points whatever the interval.
  // Throws InvalidConfigError when interval_m <= 0.
  static std::vector<std::size_t>
  sample_indices_along_distance(const ElevationProfile &profile,
                                double interval_m);
};
