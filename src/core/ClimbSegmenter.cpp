#include "core/ClimbSegmenter.hpp"

void ClimbSegmenter::step(Context &ctx, const GradientSample &g) const {
  switch (ctx.state) {
  case State::Flat:
    if (g.gradient_pct >= T.entry_pct) {
      ctx.state = State::Climbing;
      ctx.start_idx = g.from_idx;
    }
    break;
  case State::Climbing:
    if (g.gradient_pct < T.continue_pct) {
      // the drop happens on this step; the climb ends on its first point
      ctx.out.push_back({ctx.start_idx, g.from_idx});
      ctx.state = State::Flat;
    }
    break;
  }
}

std::vector<ClimbSpan>
ClimbSegmenter::segment(const std::vector<GradientSample> &grads,
                        std::size_t last_idx) const {
  Context ctx;
  for (const auto &g : grads)
    step(ctx, g);

  if (ctx.state == State::Climbing)
    ctx.out.push_back({ctx.start_idx, last_idx});
  return ctx.out;
}
