#pragma once

#include "models/CoreTypes.hpp"
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Difficulty tier, hardest first. Cat4 is the default for any admitted climb.
enum class ClimbCategory : uint8_t { HC = 0, Cat1, Cat2, Cat3, Cat4 };

inline const char *ClimbCategoryToString(ClimbCategory c) {
  switch (c) {
  case ClimbCategory::HC:
    return "HC";
  case ClimbCategory::Cat1:
    return "1";
  case ClimbCategory::Cat2:
    return "2";
  case ClimbCategory::Cat3:
    return "3";
  case ClimbCategory::Cat4:
    return "4";
  }
  return "4";
}

// Accepts "HC", "1".."4" and "cat1".."cat4" (case-insensitive prefix).
inline std::optional<ClimbCategory>
ClimbCategoryFromString(const std::string &s) {
  std::string v;
  v.reserve(s.size());
  for (char c : s)
    v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (v.rfind("cat", 0) == 0)
    v = v.substr(3);
  if (v == "hc")
    return ClimbCategory::HC;
  if (v == "1")
    return ClimbCategory::Cat1;
  if (v == "2")
    return ClimbCategory::Cat2;
  if (v == "3")
    return ClimbCategory::Cat3;
  if (v == "4")
    return ClimbCategory::Cat4;
  return std::nullopt;
}

// One row of the categorisation table. A climb qualifies for the row when
// gain > min_gain_m OR score > min_score.
struct CategoryThreshold {
  ClimbCategory category = ClimbCategory::Cat4;
  double min_gain_m = 0.0;
  double min_score = 0.0;
};

inline std::vector<CategoryThreshold> default_category_table() {
  return {{ClimbCategory::HC, 1200.0, 8000.0},
          {ClimbCategory::Cat1, 800.0, 5000.0},
          {ClimbCategory::Cat2, 500.0, 3000.0},
          {ClimbCategory::Cat3, 300.0, 1500.0}};
}

//------------------------------------------------------------------------------
// A detected, scored and categorised climb. Distances/elevations refer to the
// smoothed profile; indices point back into the caller's profile.
//------------------------------------------------------------------------------
struct Climb {
  std::size_t start_idx = 0;
  std::size_t end_idx = 0;
  double start_distance_m = 0.0;
  double end_distance_m = 0.0;
  double start_elevation_m = 0.0;
  double end_elevation_m = 0.0;
  double length_m = 0.0;
  double elevation_gain_m = 0.0;
  double avg_gradient_pct = 0.0;
  double max_gradient_pct = 0.0;
  double difficulty_score = 0.0;
  ClimbCategory category = ClimbCategory::Cat4;
};

inline void to_json(Json &j, const CategoryThreshold &t) {
  j = Json{{"category", ClimbCategoryToString(t.category)},
           {"min_gain_m", t.min_gain_m},
           {"min_score", t.min_score}};
}

inline void to_json(Json &j, const Climb &c) {
  j = Json{{"start_idx", c.start_idx},
           {"end_idx", c.end_idx},
           {"start_distance_m", c.start_distance_m},
           {"end_distance_m", c.end_distance_m},
           {"start_elevation_m", c.start_elevation_m},
           {"end_elevation_m", c.end_elevation_m},
           {"length_m", c.length_m},
           {"elevation_gain_m", c.elevation_gain_m},
           {"avg_gradient_pct", c.avg_gradient_pct},
           {"max_gradient_pct", c.max_gradient_pct},
           {"difficulty_score", c.difficulty_score},
           {"category", ClimbCategoryToString(c.category)}};
}

// Everything a renderer needs for one route.
struct ClimbAnalysis {
  RouteSummary summary;
  std::vector<double> smoothed_elevation_m;
  std::vector<Climb> climbs;
};
