// ClimbDetector orchestrates smoothing, segmentation, merging, admission and
// scoring.

#include "core/ClimbDetector.hpp"

#include "core/ClimbCategorizer.hpp"
#include "core/ClimbFilter.hpp"
#include "core/ClimbMerger.hpp"
#include "core/ClimbScorer.hpp"
#include "core/ClimbSegmenter.hpp"
#include "core/ProfileUtils.hpp"

#include <utility>

namespace {

const DetectionParams &checked(const DetectionParams &p) {
  p.validate();
  return p;
}

} // namespace

ClimbDetector::ClimbDetector(DetectionParams p) : P(checked(p)) {}

ClimbAnalysis ClimbDetector::analyze(const ElevationProfile &profile) const {
  ProfileUtils::validate(profile);

  ClimbAnalysis result;
  result.summary = ProfileUtils::summarize(profile);

  // 1) Denoise elevation, distances pass through
  result.smoothed_elevation_m = ProfileUtils::smooth(profile, P.smoothing_window);
  const ElevationProfile smoothed =
      ProfileUtils::with_elevations(profile, result.smoothed_elevation_m);

  // 2) Per-step gradients (duplicate points dropped)
  const auto grads = ProfileUtils::gradients(smoothed);

  // 3) Hysteresis segmentation into candidate spans
  ClimbSegmenter segmenter({P.min_gradient_pct, P.break_gradient_pct});
  const auto spans = segmenter.segment(grads, smoothed.size() - 1);

  // 4) Gap merge, measured over the merged span
  ClimbScorer scorer(smoothed, grads);
  ClimbMerger merger(P.merge_gap_m);
  auto climbs = merger.merge(spans, scorer);

  // 5) Admission
  ClimbFilter filter({P.min_elevation_gain_m, P.min_gradient_pct,
                      P.min_length_m});
  climbs = filter.apply(std::move(climbs));

  // 6) Score + categorise
  ClimbCategorizer categorizer(P.categories);
  for (auto &c : climbs) {
    scorer.score(c);
    c.category = categorizer.categorize(c.elevation_gain_m, c.difficulty_score);
  }

  result.climbs = std::move(climbs);
  return result;
}

std::vector<Climb>
ClimbDetector::detect(const ElevationProfile &profile) const {
  return analyze(profile).climbs;
}

std::vector<Climb> detect_climbs(const ElevationProfile &profile,
                                 const DetectionParams &params) {
  return ClimbDetector(params).detect(profile);
}
