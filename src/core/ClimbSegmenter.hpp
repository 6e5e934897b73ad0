#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

//------------------------------------------------------------------------------
// ClimbSegmenter: hysteresis state machine over a gradient series.
//
//   FLAT     --(g >= entry_pct)-->  CLIMBING   start = step's first point
//   CLIMBING --(g >= continue_pct)--> CLIMBING end   = step's last point
//   CLIMBING --(g <  continue_pct)--> FLAT     emit [start, step's first point]
//
// An open climb at the end of the series is closed on the profile's last
// point.
//------------------------------------------------------------------------------
class ClimbSegmenter {
public:
  enum class State : uint8_t { Flat = 0, Climbing = 1 };

  struct Thresholds {
    double entry_pct = 3.0;    // min_gradient_pct
    double continue_pct = 0.0; // break_gradient_pct
  };

  explicit ClimbSegmenter(Thresholds t) : T(t) {}

  // `last_idx` is the index of the profile's final point.
  std::vector<ClimbSpan> segment(const std::vector<GradientSample> &grads,
                                 std::size_t last_idx) const;

private:
  Thresholds T;

  // Per-call machine state; lives on the stack of segment().
  struct Context {
    State state = State::Flat;
    std::size_t start_idx = 0;
    std::vector<ClimbSpan> out;
  };

  void step(Context &ctx, const GradientSample &g) const;
};
