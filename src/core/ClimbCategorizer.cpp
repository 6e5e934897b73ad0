#include "core/ClimbCategorizer.hpp"

ClimbCategory ClimbCategorizer::categorize(double elevation_gain_m,
                                           double difficulty_score) const {
  for (const auto &row : table_) {
    if (elevation_gain_m > row.min_gain_m || difficulty_score > row.min_score)
      return row.category;
  }
  return ClimbCategory::Cat4;
}
