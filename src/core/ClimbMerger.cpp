#include "core/ClimbMerger.hpp"

std::vector<ClimbSpan>
ClimbMerger::merge_spans(const std::vector<ClimbSpan> &spans,
                         const ElevationProfile &profile) const {
  std::vector<ClimbSpan> out;
  if (spans.empty())
    return out;
  out.reserve(spans.size());

  const auto &pts = profile.points;
  ClimbSpan cur = spans.front();
  for (std::size_t i = 1; i < spans.size(); ++i) {
    const auto &next = spans[i];
    const double gap =
        pts.at(next.start_idx).distance_m - pts.at(cur.end_idx).distance_m;
    if (gap <= merge_gap_m_) {
      cur.end_idx = next.end_idx;
    } else {
      out.push_back(cur);
      cur = next;
    }
  }
  out.push_back(cur);
  return out;
}

std::vector<Climb> ClimbMerger::merge(const std::vector<ClimbSpan> &spans,
                                      const ClimbScorer &scorer) const {
  std::vector<Climb> out;
  for (const auto &span : merge_spans(spans, scorer.profile()))
    out.push_back(scorer.measure(span));
  return out;
}
