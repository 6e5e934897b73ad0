#pragma once
#include "models/Climb.hpp"
#include <utility>
#include <vector>

// Ordered threshold lookup, hardest row first, first match wins. A row
// matches when gain > min_gain_m OR score > min_score; no match means Cat4.
class ClimbCategorizer {
public:
  explicit ClimbCategorizer(
      std::vector<CategoryThreshold> table = default_category_table())
      : table_(std::move(table)) {}

  ClimbCategory categorize(double elevation_gain_m,
                           double difficulty_score) const;

  const std::vector<CategoryThreshold> &table() const noexcept {
    return table_;
  }

private:
  std::vector<CategoryThreshold> table_;
};
