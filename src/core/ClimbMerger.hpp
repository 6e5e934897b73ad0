#pragma once
#include "core/ClimbScorer.hpp"
#include "models/Climb.hpp"
#include "models/CoreTypes.hpp"
#include <vector>

// Joins candidate spans whose distance gap (next.start - current.end) is
// <= merge_gap_m. Chains collapse transitively. Merged climbs are measured
// over their full span, so gain is end - start rather than a sum of parts.
class ClimbMerger {
public:
  explicit ClimbMerger(double merge_gap_m) : merge_gap_m_(merge_gap_m) {}

  // Spans must be ordered by start_idx and non-overlapping.
  std::vector<ClimbSpan> merge_spans(const std::vector<ClimbSpan> &spans,
                                     const ElevationProfile &profile) const;

  std::vector<Climb> merge(const std::vector<ClimbSpan> &spans,
                           const ClimbScorer &scorer) const;

private:
  double merge_gap_m_;
};
