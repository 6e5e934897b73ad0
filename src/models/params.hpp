#pragma once

#include "models/Climb.hpp"
#include "models/CoreTypes.hpp"
#include <vector>

// User-supplied parameters controlling climb detection. One value is built per
// detection call and never mutated afterwards.
struct DetectionParams {
  double min_gradient_pct = 3.0;      // entry threshold and admission minimum
  double min_elevation_gain_m = 20.0; // admission minimum
  double break_gradient_pct = 0.0;    // continuation threshold
  int smoothing_window = 5;           // odd, samples
  double merge_gap_m = 250.0;
  double min_length_m = 0.0; // 0 disables the length gate
  std::vector<CategoryThreshold> categories = default_category_table();

  // Overlay recognised keys of `j` onto `base`. Throws InvalidConfigError on
  // type mismatches; unknown keys are ignored.
  static DetectionParams from_json(const Json &j,
                                   const DetectionParams &base);
  static DetectionParams from_json(const Json &j) {
    return from_json(j, DetectionParams{});
  }

  // Throws InvalidConfigError if any parameter is unusable.
  void validate() const;
};

void to_json(Json &j, const DetectionParams &p);
