#pragma once
#include "models/Climb.hpp"
#include "models/CoreTypes.hpp"
#include <vector>

// Measures climb spans against the smoothed profile and assigns the
// difficulty score (gain * average gradient). Holds references only; both
// inputs must outlive the scorer.
class ClimbScorer {
public:
  ClimbScorer(const ElevationProfile &smoothed,
              const std::vector<GradientSample> &grads)
      : profile_(smoothed), grads_(grads) {}

  // Geometry of the span: distances, elevations, length, gain (end - start),
  // average gradient and the steepest gradient sample inside the span.
  Climb measure(const ClimbSpan &span) const;

  // avg_gradient_pct = 100 * gain / length; difficulty = gain * avg.
  void score(Climb &c) const;

  const ElevationProfile &profile() const noexcept { return profile_; }

private:
  const ElevationProfile &profile_;
  const std::vector<GradientSample> &grads_;

  double max_gradient_in(const ClimbSpan &span) const;
};
