#pragma once
#include "models/Climb.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <vector>

//------------------------------------------------------------------------------
// ClimbDetector: profile + params -> ordered, non-overlapping climbs.
//
// raw profile -> smoothed profile -> gradient series -> candidate spans
//   -> merged climbs -> admitted climbs -> scored/categorised climbs
//
// Pure and synchronous: every intermediate is local to the call, so one
// detector can serve concurrent callers.
//------------------------------------------------------------------------------
class ClimbDetector {
public:
  // Throws InvalidConfigError if the params are unusable.
  explicit ClimbDetector(DetectionParams p = DetectionParams{});
  ~ClimbDetector() = default;

  const DetectionParams &params() const noexcept { return P; }

  // Throws InvalidInputError on a malformed profile; an empty result is not an
  // error.
  std::vector<Climb> detect(const ElevationProfile &profile) const;

  // detect() plus the route summary and the smoothed elevation series.
  ClimbAnalysis analyze(const ElevationProfile &profile) const;

private:
  const DetectionParams P;
};

// One-shot form of ClimbDetector(params).detect(profile).
std::vector<Climb> detect_climbs(const ElevationProfile &profile,
                                 const DetectionParams &params);
